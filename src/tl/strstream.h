#pragma once

#include <stdio.h>
#include <string>

#include "tl/int.h"

namespace tl {

class Color;

/// Minimal string builder used by the logging macros. Integers print as
/// numbers (u8 included), floats with three decimals.
class StrStream {
  public:
    StrStream() = default;

    const std::string &str() const { return mStr; }
    const char *c_str() const { return mStr.c_str(); }

    StrStream &operator<<(const char *str) {
        if (str) {
            mStr.append(str);
        }
        return *this;
    }
    StrStream &operator<<(const std::string &str) {
        mStr.append(str);
        return *this;
    }
    StrStream &operator<<(const StrStream &strStream) {
        mStr.append(strStream.str());
        return *this;
    }
    StrStream &operator<<(char c) {
        mStr.push_back(c);
        return *this;
    }
    StrStream &operator<<(bool b) {
        mStr.append(b ? "true" : "false");
        return *this;
    }
    StrStream &operator<<(u8 n) { return appendUnsigned(n); }
    StrStream &operator<<(u16 n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned int n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned long n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned long long n) { return appendUnsigned(n); }
    StrStream &operator<<(i8 n) { return appendSigned(n); }
    StrStream &operator<<(i16 n) { return appendSigned(n); }
    StrStream &operator<<(int n) { return appendSigned(n); }
    StrStream &operator<<(long n) { return appendSigned(n); }
    StrStream &operator<<(long long n) { return appendSigned(n); }
    StrStream &operator<<(float f) { return appendFloat(f); }
    StrStream &operator<<(double f) { return appendFloat(f); }

    StrStream &operator<<(const Color &color);

  private:
    StrStream &appendUnsigned(unsigned long long n) {
        char buf[24];
        snprintf(buf, sizeof(buf), "%llu", n);
        mStr.append(buf);
        return *this;
    }
    StrStream &appendSigned(long long n) {
        char buf[24];
        snprintf(buf, sizeof(buf), "%lld", n);
        mStr.append(buf);
        return *this;
    }
    StrStream &appendFloat(double f) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.3f", f);
        mStr.append(buf);
        return *this;
    }

    std::string mStr;
};

} // namespace tl
