#ifndef BURST_TEST_HPP
#define BURST_TEST_HPP

#include <burst/types.h>

/* Each backend gets its own test case. Functions passed in should return
 * early (with a warning) if the backend is not available on this host */

#define TEST_ALL_BACKENDS(name, fn)                                           \
    BOOST_AUTO_TEST_SUITE(name)                                               \
    BOOST_AUTO_TEST_CASE(cpu) { fn(BURST_BACKEND_CPU); }                      \
    BOOST_AUTO_TEST_CASE(wgpu) { fn(BURST_BACKEND_WGPU); }                    \
    BOOST_AUTO_TEST_CASE(cuda) { fn(BURST_BACKEND_CUDA); }                    \
    BOOST_AUTO_TEST_SUITE_END()

// n-ary function for n >= 2
#define TEST_ALL_BACKENDS_N(name, fn,...)                                     \
    BOOST_AUTO_TEST_SUITE(name)                                               \
    BOOST_AUTO_TEST_CASE(cpu) { fn(BURST_BACKEND_CPU, __VA_ARGS__); }         \
    BOOST_AUTO_TEST_CASE(wgpu) { fn(BURST_BACKEND_WGPU, __VA_ARGS__); }       \
    BOOST_AUTO_TEST_CASE(cuda) { fn(BURST_BACKEND_CUDA, __VA_ARGS__); }       \
    BOOST_AUTO_TEST_SUITE_END()

#endif
