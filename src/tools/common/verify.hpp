//
// Created by anton on 19.12.2019.
//

#pragma once

#include <iostream>
#include <execinfo.h>
#include <cstdlib>
#include <cassert>

// Standard output carries command results, so every diagnostic here goes to stderr.
inline void print_stacktrace() {
    std::cerr << "=== Stack Trace ===" << std::endl;

    const size_t max_stack_size = 1000;

    void *stack_pointers[max_stack_size];
    int count = backtrace(stack_pointers, max_stack_size);

    char **func_names = backtrace_symbols(stack_pointers, count);

    for (int i = 0; i < count; ++i)
        std::cerr << func_names[i] << std::endl;

    free(func_names);
}

#define VERIFY(expr)                                             \
    do {                                                         \
        if (!(expr)) {                                           \
            std::cerr << "Verification failed: " << #expr        \
                      << " at " << __FILE__ << ":" << __LINE__   \
                      << std::endl;                              \
            print_stacktrace();                                  \
            abort();                                             \
        }                                                        \
    } while(0)

#define VERIFY_MSG(expr, msg)                                    \
    do {                                                         \
        if (!(expr)) {                                           \
            std::cerr << msg << std::endl;                       \
            print_stacktrace();                                  \
            abort();                                             \
        }                                                        \
    } while(0)
