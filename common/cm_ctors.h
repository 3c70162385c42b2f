#pragma once

// Helper macro to delete copy-moves inside class definition.

// NOLINTNEXTLINE
#define NO_COPYMOVE(TYPE)                                                                          \
    TYPE(const TYPE &) = delete;                                                                   \
    TYPE(TYPE &&) = delete;                                                                        \
    TYPE &operator=(const TYPE &) = delete;                                                        \
    TYPE &operator=(TYPE &&) = delete

