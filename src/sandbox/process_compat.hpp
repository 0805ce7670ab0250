#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the original Boost.Process API under process/v1.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/async_pipe.hpp>
#include <boost/process/v1/extend.hpp>

namespace runbox::sandbox {
namespace bp = boost::process::v1;
}  // namespace runbox::sandbox
#else
#include <boost/process.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/extend.hpp>

namespace runbox::sandbox {
namespace bp = boost::process;
}  // namespace runbox::sandbox
#endif
