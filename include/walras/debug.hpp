#pragma once
#include <iostream>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <string>

#ifdef WALRAS_DEBUG
#define WALRAS_DEBUG_BOOL true
#else
#define WALRAS_DEBUG_BOOL false
#endif

namespace walras {
// Chops everything before the last 'walras/' off of __FILE__, to make output a bit nicer.
inline std::string _DEBUG__FILE__(const char *f) {
    std::string file(f);
    auto e = file.rfind("/walras/");
    return e == std::string::npos ? file : file.substr(e+1);
}
}
#define _walras__FILE__ walras::_DEBUG__FILE__(__FILE__)

#define _walras_dbgf(prefix, format, ...) fprintf(stderr, "%s%s:%d:%s(): " format "\n", prefix, _walras__FILE__.c_str(), __LINE__, __func__, ##__VA_ARGS__); std::cerr << std::flush
#define _walras_dbg(prefix, stuff) std::ostringstream dbg_out_; dbg_out_ << prefix << _walras__FILE__ << ":" << __LINE__ << ":" << __func__ << "(): " << stuff << "\n"; std::cerr << dbg_out_.str() << std::flush

/** Debugging macro.  WALRAS_DBGF(format, args) formats like printf and sends the output to stderr,
 * prepended with the file/line number/function, and appended with a newline.
 *
 * Does nothing unless compiled with `-DWALRAS_DEBUG`.
 */
#define WALRAS_DBGF(format, ...) do { if (WALRAS_DEBUG_BOOL) { _walras_dbgf("", format, ##__VA_ARGS__); } } while (0)

/** Debugging macro.  WALRAS_DBG(a << b << c); sends a << b << c into std::cerr when debugging is
 * enabled, and does nothing otherwise.  The debugging output has the file/line/function prepended,
 * and a newline appended.
 *
 * Does nothing unless compiled with `-DWALRAS_DEBUG`.
 */
#define WALRAS_DBG(stuff) do { if (WALRAS_DEBUG_BOOL) { _walras_dbg("", stuff); } } while (0)

/** Debugging macro for a single variable.  WALRAS_DBGVAR(x) is an alias for WALRAS_DBG("x = " << (x)) */
#define WALRAS_DBGVAR(x) WALRAS_DBG(#x " = " << (x))

#define _walras_tstr std::time_t t = std::time(nullptr); char tstr[100]; std::strftime(tstr, sizeof(tstr), "[%c] ", std::localtime(&t))

/** Debugging macro just like `WALRAS_DBGF` but also prefixes output with the current date and time. */
#define WALRAS_TDBGF(format, ...) do { if (WALRAS_DEBUG_BOOL) { _walras_tstr; _walras_dbgf(tstr, format, ##__VA_ARGS__); } } while (0)

/** Debugging macro just like `WALRAS_DBG`, but also prefixes output with the current date and time. */
#define WALRAS_TDBG(stuff) do { if (WALRAS_DEBUG_BOOL) { _walras_tstr; _walras_dbg(tstr, stuff); } } while (0)

/** Warning macro.  Unlike the debugging macros this is always enabled: WALRAS_WARN(a << b) writes
 * "WARNING: " followed by the file/line/function and the given output to std::cerr.  Used for
 * every condition the pipeline attaches as a Warning, so that fallbacks are never silent.
 */
#define WALRAS_WARN(stuff) do { _walras_dbg("WARNING: ", stuff); } while (0)
