#pragma once

#include <cstdio>
#include <cstdlib>

// Branch hints
#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

#define CACHE_LINE_SIZE 64
#define CACHE_ALIGNED alignas(CACHE_LINE_SIZE)

// Printf format checking for variadic helpers
#define PRINTF_FORMAT(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))

// Delete copy/move for classes owning threads, handles or locks
#define DELETE_COPY_AND_MOVE(Type)          \
  Type(const Type&) = delete;               \
  Type& operator=(const Type&) = delete;    \
  Type(Type&&) = delete;                    \
  Type& operator=(Type&&) = delete
