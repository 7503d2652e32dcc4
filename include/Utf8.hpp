#pragma once
#include <cstddef>

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const char* data, std::size_t len) noexcept;
