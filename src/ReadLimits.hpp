#pragma once
#include <cstddef>

// Cap on the bytes returned by one line-window read, and on each file of a batch read.
constexpr size_t kMaxContentBytes = 10 * 1024 * 1024;

constexpr long long kMaxLinesLimit = 10000;
constexpr long long kDefaultMaxLines = 200;
constexpr long long kDefaultBeginLine = 1;

constexpr const char* kDefaultEncoding = "utf-8";

// Upper bound on the encoded bytes of one character in any supported charset.
constexpr size_t kMaxBytesPerChar = 4;
