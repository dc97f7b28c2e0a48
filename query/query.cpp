// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "query.hpp"

#include "utility/errors.hpp"
#include "utility/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace {

    bool is_blank(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }

    // An uppercase GO alone on its line, optionally followed by a repeat count.
    // Returns the position just past the line, or nullopt.
    std::optional<size_t> go_line_end(std::string_view text, size_t pos) noexcept {
        if (text.compare(pos, 2, "GO") != 0) {
            return std::nullopt;
        }
        size_t start = pos;
        while (start > 0 && is_blank(text[start - 1])) {
            --start;
        }
        if (start > 0 && text[start - 1] != '\n') {
            return std::nullopt;
        }
        size_t end = pos + 2;
        while (end < text.size() && is_blank(text[end])) {
            ++end;
        }
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])) != 0) {
            ++end;
        }
        while (end < text.size() && is_blank(text[end])) {
            ++end;
        }
        if (end < text.size() && text[end] != '\n') {
            return std::nullopt;
        }
        return end;
    }

    std::string_view strip_at(std::string_view name) {
        if (!name.empty() && name.front() == '@') {
            name.remove_prefix(1);
        }
        if (name.empty()) {
            throw tidepool::validation_error("A parameter \"name\" argument is required.");
        }
        return name;
    }

    // position just past `keyword` when the statement starts with it followed by whitespace
    std::optional<size_t> leading_keyword(std::string_view text, std::string_view keyword) {
        if (tidepool::istarts_with(text, keyword) && text.size() > keyword.size() &&
            tidepool::is_space(text[keyword.size()])) {
            return keyword.size();
        }
        return std::nullopt;
    }

} // namespace

namespace tidepool {

    std::string_view to_string(query_mode mode) noexcept {
        switch (mode) {
            case query_mode::query:
                return "QUERY";
            case query_mode::exec:
                return "EXEC";
            case query_mode::batch:
                return "BATCH";
        }
        return "UNKNOWN";
    }

    bool has_statement_separator(std::string_view text) noexcept {
        size_t i = 0;
        auto more_after = [&text](size_t pos) { return !trim(text.substr(pos), ";").empty(); };
        while (i < text.size()) {
            char c = text[i];
            if (c == '\'' || c == '"' || c == '[') {
                char close = c == '[' ? ']' : c;
                ++i;
                while (i < text.size()) {
                    if (text[i] == close) {
                        // doubled delimiter is an escaped one
                        if (i + 1 < text.size() && text[i + 1] == close) {
                            i += 2;
                            continue;
                        }
                        break;
                    }
                    ++i;
                }
                ++i;
                continue;
            }
            if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
                auto eol = text.find('\n', i);
                i = eol == std::string_view::npos ? text.size() : eol + 1;
                continue;
            }
            if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
                auto close = text.find("*/", i + 2);
                i = close == std::string_view::npos ? text.size() : close + 2;
                continue;
            }
            if (c == ';' && more_after(i + 1)) {
                return true;
            }
            if (c == 'G') {
                if (auto end = go_line_end(text, i); end && more_after(*end)) {
                    return true;
                }
            }
            ++i;
        }
        return false;
    }

    query& query::sql(std::string_view statement) {
        auto trimmed = trim(statement, ";");
        if (trimmed.empty()) {
            throw validation_error("The parameter \"statement\" argument is required.");
        }

        auto keyword_end = leading_keyword(trimmed, "EXECUTE");
        if (!keyword_end) {
            keyword_end = leading_keyword(trimmed, "EXEC");
        }
        if (keyword_end) {
            auto target = trim(trimmed.substr(*keyword_end), ";");
            if (!target.empty() && !has_statement_separator(target)) {
                mode_ = query_mode::exec;
                statement_ = std::string(target);
                return *this;
            }
        }

        mode_ = params_.empty() && has_statement_separator(statement) ? query_mode::batch : query_mode::query;
        statement_ = std::string(statement);
        return *this;
    }

    query& query::sql(std::string_view statement, const named_values& params) {
        sql(statement);
        for (const auto& [name, value] : params) {
            in(name, value);
        }
        return *this;
    }

    query& query::in(std::string_view name, sql_value value) {
        auto type = infer_sql_type(value);
        return add(name, parameter_direction::in, type, std::move(value), {});
    }

    query& query::in(std::string_view name, sql_type type, sql_value value, parameter_options options) {
        return add(name, parameter_direction::in, type, std::move(value), options);
    }

    query& query::in(std::string_view name, std::string_view type, sql_value value, parameter_options options) {
        return add(name, parameter_direction::in, parse_sql_type(type), std::move(value), options);
    }

    query& query::out(std::string_view name, sql_type type, sql_value value, parameter_options options) {
        return add(name, parameter_direction::out, type, std::move(value), options);
    }

    query& query::out(std::string_view name, std::string_view type, sql_value value, parameter_options options) {
        return add(name, parameter_direction::out, parse_sql_type(type), std::move(value), options);
    }

    query& query::add(std::string_view name,
                      parameter_direction direction,
                      sql_type type,
                      sql_value value,
                      parameter_options options) {
        name = strip_at(name);
        if (find(name) != nullptr) {
            throw validation_error("A parameter named \"" + std::string(name) + "\" has already been declared.");
        }
        // parameters can not be bound to a raw batch
        if (mode_ == query_mode::batch) {
            mode_ = query_mode::query;
        }
        params_.push_back(parameter{std::string(name), direction, type, std::move(value), options});
        return *this;
    }

    bool query::remove(std::string_view name) {
        name = strip_at(name);
        auto it = std::find_if(params_.begin(), params_.end(), [name](const parameter& p) { return p.name == name; });
        if (it == params_.end()) {
            return false;
        }
        params_.erase(it);
        return true;
    }

    query& query::clear() {
        statement_.clear();
        mode_ = query_mode::query;
        params_.clear();
        timeout_.reset();
        return *this;
    }

    query& query::timeout(std::optional<std::chrono::milliseconds> timeout) {
        if (timeout && timeout->count() < 0) {
            throw validation_error("The parameter \"ms\" argument must be greater than or equal to zero.");
        }
        timeout_ = timeout;
        return *this;
    }

    query& query::batch() {
        if (!params_.empty()) {
            throw validation_error("The query cannot be set to BATCH mode when query parameters are present: " +
                                   std::to_string(params_.size()) + " parameters were declared.");
        }
        mode_ = query_mode::batch;
        return *this;
    }

    query& query::exec() {
        mode_ = query_mode::exec;
        return *this;
    }

    const parameter* query::find(std::string_view name) const noexcept {
        auto it = std::find_if(params_.begin(), params_.end(), [name](const parameter& p) { return p.name == name; });
        return it == params_.end() ? nullptr : &*it;
    }

} // namespace tidepool
