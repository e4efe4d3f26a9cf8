#ifndef TRACE_HPP
#define TRACE_HPP

namespace funcobj {
    // Master flag - set to false to disable all debug tracing at compile time.
    inline constexpr bool ENABLE_TRACING = false;

    // Function calls forwarded to the evaluator.
    inline constexpr bool TRACE_CALLS = ENABLE_TRACING && true;

    // Attribute get/set/delete through the object protocol.
    inline constexpr bool TRACE_ATTRIBUTES = ENABLE_TRACING && true;
    inline constexpr bool TRACE_ATTRIBUTES_DETAIL = ENABLE_TRACING && false;

    // Bundle loading.
    inline constexpr bool TRACE_BUNDLE_READER = ENABLE_TRACING && false;

    // Main program tracing.
    inline constexpr bool TRACE_MAIN = ENABLE_TRACING && false;
}

#endif // TRACE_HPP
