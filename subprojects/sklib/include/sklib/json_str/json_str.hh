#pragma once

#include <cstddef>
#include <optional>
#include <sklib/concat_tostr.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Builds compact JSON text directly into a std::string
namespace json_str {

// Appends @p str as a quoted JSON string literal
void append_stringified_json(std::string& dest, std::string_view str);

// Appends the shortest representation of @p val that round-trips, or null
// for infinities and NaN
void append_json_double(std::string& dest, double val);

namespace detail {

template <class T>
constexpr inline bool is_optional = false;
template <class T>
constexpr inline bool is_optional<std::optional<T>> = true;

template <class T>
void append_value(std::string& dest, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        dest += (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::nullptr_t> or std::is_same_v<T, std::nullopt_t>) {
        dest += "null";
    } else if constexpr (std::is_integral_v<T>) {
        back_insert(dest, val);
    } else if constexpr (std::is_floating_point_v<T>) {
        append_json_double(dest, static_cast<double>(val));
    } else if constexpr (is_optional<T>) {
        if (val) {
            append_value(dest, *val);
        } else {
            dest += "null";
        }
    } else {
        append_stringified_json(dest, std::string_view{val});
    }
}

// Owns the text of a top-level value, a base class so that it is constructed
// before the builder referencing it
struct OwnedText {
    std::string text;
};

} // namespace detail

class ObjectBuilder;

class ArrayBuilder {
    std::string& dest_;
    bool has_elems_ = false;

    friend class Array;
    friend class ObjectBuilder;

    explicit ArrayBuilder(std::string& dest)
    : dest_{dest} {}

    void begin_elem() {
        if (has_elems_) {
            dest_ += ',';
        }
        has_elems_ = true;
    }

public:
    template <class T>
    void val(const T& value) {
        begin_elem();
        detail::append_value(dest_, value);
    }

    void val(const char* str) {
        begin_elem();
        append_stringified_json(dest_, str);
    }

    template <class Func>
    void val_arr(Func&& func);

    template <class Func>
    void val_obj(Func&& func);
};

class ObjectBuilder {
    std::string& dest_;
    bool has_props_ = false;

    friend class Object;
    friend class ArrayBuilder;

    explicit ObjectBuilder(std::string& dest)
    : dest_{dest} {}

    void begin_prop(std::string_view name) {
        if (has_props_) {
            dest_ += ',';
        }
        has_props_ = true;
        append_stringified_json(dest_, name);
        dest_ += ':';
    }

public:
    template <class T>
    void prop(std::string_view name, const T& value) {
        begin_prop(name);
        detail::append_value(dest_, value);
    }

    void prop(std::string_view name, const char* str) {
        begin_prop(name);
        append_stringified_json(dest_, str);
    }

    template <class Func>
    void prop_arr(std::string_view name, Func&& func) {
        begin_prop(name);
        dest_ += '[';
        ArrayBuilder arr{dest_};
        std::forward<Func>(func)(arr);
        dest_ += ']';
    }
};

template <class Func>
void ArrayBuilder::val_arr(Func&& func) {
    begin_elem();
    dest_ += '[';
    ArrayBuilder arr{dest_};
    std::forward<Func>(func)(arr);
    dest_ += ']';
}

template <class Func>
void ArrayBuilder::val_obj(Func&& func) {
    begin_elem();
    dest_ += '{';
    ObjectBuilder obj{dest_};
    std::forward<Func>(func)(obj);
    dest_ += '}';
}

class Object
: detail::OwnedText
, public ObjectBuilder {
public:
    Object()
    : OwnedText{"{"}
    , ObjectBuilder{OwnedText::text} {}

    Object(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(const Object&) = delete;
    Object& operator=(Object&&) = delete;

    ~Object() = default;

    std::string into_str() && {
        text += '}';
        return std::move(text);
    }
};

class Array
: detail::OwnedText
, public ArrayBuilder {
public:
    Array()
    : OwnedText{"["}
    , ArrayBuilder{OwnedText::text} {}

    Array(const Array&) = delete;
    Array(Array&&) = delete;
    Array& operator=(const Array&) = delete;
    Array& operator=(Array&&) = delete;

    ~Array() = default;

    std::string into_str() && {
        text += ']';
        return std::move(text);
    }
};

} // namespace json_str
