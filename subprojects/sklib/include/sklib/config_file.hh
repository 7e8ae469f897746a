#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <sklib/concat_tostr.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg)
        : runtime_error(msg) {}

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)
          ) {}

        using runtime_error::what;

        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        friend class ConfigFile;
    };

    class Variable {
        bool set_ = false;
        std::string str_;
        size_t line_ = 0;

        void unset() noexcept {
            set_ = false;
            str_.clear();
            line_ = 0;
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return set_; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            return (str_ == "1" || str_ == "on" || str_ == "true");
        }

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            auto [ptr, ec] = std::from_chars(str_.data(), str_.data() + str_.size(), res);
            if (ec != std::errc{} or ptr != str_.data() + str_.size()) {
                return std::nullopt;
            }
            return res;
        }

        // Returns value as string (empty if variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Line of the config the value was read from (0 if not set)
        [[nodiscard]] size_t line() const noexcept { return line_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_; // (name => value)
    static const Variable null_var;

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    void clear() { vars_.clear(); }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return (it != vars_.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars_)& get_vars() const { return vars_; }

    /**
     * @brief Loads config (variables) from file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether to load all variables from @p pathname or only
     *   these from the variable set
     *
     * @errors Throws std::runtime_error if the file cannot be read and all
     *   exceptions from load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) from string @p config
     * @details Syntax: one `name: value` per line, '#' starts a comment,
     *   value is a literal (trimmed), a single-quoted string ('' escapes ')
     *   or a double-quoted string with C escape sequences
     *
     * @errors Throws ParseError if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);

    // Escapes @p str so that it can be safely placed in a config file
    static std::string escape_string(std::string_view str);
};

inline const ConfigFile::Variable ConfigFile::null_var{};
