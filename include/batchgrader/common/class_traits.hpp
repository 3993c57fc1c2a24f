/// \file
/// Empty bases that mark a class's copy/move semantics at the point of declaration
#pragma once

#include <type_traits>

namespace batchgrader {

/// Base of types that own a unique resource (a child process, a temporary directory).
/// Moving transfers ownership; copying is not allowed.
class NonCopyable
{
public:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

/// Base of types whose address is handed out to other threads or objects (pools, sandboxes)
/// and so must stay put.
class NonMovable : public NonCopyable
{
public:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;
};

static_assert(std::is_move_constructible_v<NonCopyable> && !std::is_copy_assignable_v<NonCopyable>);
static_assert(!std::is_move_constructible_v<NonMovable> && !std::is_copy_constructible_v<NonMovable>);

} // namespace batchgrader
