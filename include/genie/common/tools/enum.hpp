/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_ENUM_HPP_
#define GENIE_ENUM_HPP_

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace genie {

/**
 * Converts enum values to strings.
 *
 * T should declare enum class Enum and static GetStrings() returning string per enum value.
 *
 * @tparam T enum type description.
 */
template <class T>
class EnumStringer {
public:
    using EnumType = typename T::Enum;

    /**
     * Constructor.
     *
     * @param value enum value.
     */
    // cppcheck-suppress noExplicitConstructor
    EnumStringer(EnumType value = static_cast<EnumType>(0))
        : mValue(value)
    {
    }

    /**
     * Returns enum value.
     *
     * @return EnumType.
     */
    EnumType GetValue() const { return mValue; }

    /**
     * Casts to enum value.
     */
    operator EnumType() const { return mValue; }

    /**
     * Returns string representation of enum value.
     *
     * @return std::string.
     */
    std::string ToString() const
    {
        const auto& strings = T::GetStrings();
        auto        index   = static_cast<size_t>(mValue);

        if (index >= strings.size()) {
            return "unknown";
        }

        return strings[index];
    }

    /**
     * Parses enum value from string.
     *
     * @param str string to parse.
     * @return bool true if string matches one of enum values.
     */
    bool FromString(const std::string& str)
    {
        const auto& strings = T::GetStrings();

        for (size_t i = 0; i < strings.size(); i++) {
            if (strings[i] == str) {
                mValue = static_cast<EnumType>(i);

                return true;
            }
        }

        return false;
    }

    bool operator==(const EnumStringer& other) const { return mValue == other.mValue; }
    bool operator!=(const EnumStringer& other) const { return mValue != other.mValue; }
    bool operator==(EnumType value) const { return mValue == value; }
    bool operator!=(EnumType value) const { return mValue != value; }

    /**
     * Outputs enum to stream.
     */
    friend std::ostream& operator<<(std::ostream& os, const EnumStringer& value) { return os << value.ToString(); }

private:
    EnumType mValue;
};

} // namespace genie

#endif
