#include <cctype>
#include <fstream>
#include <sklib/config_file.hh>
#include <sklib/debug.hh>
#include <sstream>

static bool is_ws_or_special(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) or c == '\'' or c == '"';
}

void ConfigFile::load_config_from_file(const std::string& pathname, bool load_all) {
    std::ifstream file(pathname);
    if (not file.is_open()) {
        THROW("cannot open config file '", pathname, "'", errmsg());
    }

    std::stringstream contents;
    contents << file.rdbuf();
    load_config_from_string(std::move(contents).str(), load_all);
}

void ConfigFile::load_config_from_string(std::string config, bool load_all) {
    // Set all variables as unused
    for (auto& [name, var] : vars_) {
        var.unset();
    }

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and std::isspace(static_cast<unsigned char>(c))); };
    // Checks whether character is one of these [a-zA-Z0-9\-_.]
    auto is_name = [](char c) {
        return (std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_' or c == '.');
    };

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;
    size_t line = 1;
    size_t line_beg = 0;

    auto throw_parse_error = [&](auto&&... args) {
        ParseError pe(line, pos - line_beg + 1, std::forward<decltype(args)>(args)...);
        auto line_end = config.find('\n', line_beg);
        pe.diagnostics_ = concat_tostr(
            std::string_view{config}.substr(line_beg, line_end - line_beg),
            '\n',
            std::string(pos - line_beg, ' '),
            '^'
        );
        throw std::move(pe);
    };

    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };

    auto extract_value = [&]() -> std::string {
        std::string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    if (config[pos + 1] != '\'') { // Safe: newline ends every line
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // Literal: up to a comment or the end of the line, trailing white-spaces removed
        size_t beg = pos;
        while (config[pos] != '\n' and config[pos] != '#') {
            ++pos;
        }
        size_t end = pos;
        while (end > beg and is_ws(config[end - 1])) {
            --end;
        }
        return config.substr(beg, end - beg);
    };

    Variable ignored;
    while (pos < config.size()) {
        skip_ws();
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            ++line;
            line_beg = pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            pos = config.find('\n', pos);
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        std::string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_ws();

        /* Value */
        Variable* varp = nullptr;
        if (load_all) {
            varp = &vars_[name];
        } else {
            auto it = vars_.find(name);
            varp = (it != vars_.end() ? &it->second : &ignored);
        }
        Variable& var = *varp;
        var.unset();
        var.set_ = true;
        var.line_ = line;
        if (config[pos] != '\n' and config[pos] != '#') {
            var.str_ = extract_value();
        }

        /* Rest of the line */
        skip_ws();
        if (config[pos] == '#') {
            pos = config.find('\n', pos);
        } else if (config[pos] != '\n') {
            throw_parse_error("Unexpected character after the value: `", config[pos], '`');
        }
    }
}

std::string ConfigFile::escape_string(std::string_view str) {
    bool needs_quoting = str.empty() or is_ws_or_special(str.front()) or
        is_ws_or_special(str.back()) or str.find_first_of("#'\"\n") != std::string_view::npos;
    if (not needs_quoting) {
        return std::string{str};
    }

    std::string res = "\"";
    for (char c : str) {
        switch (c) {
        case '"': res += "\\\""; break;
        case '\\': res += "\\\\"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        default: res += c;
        }
    }
    res += '"';
    return res;
}
