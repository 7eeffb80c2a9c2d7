#ifndef __HYPERIDX_H__
#define __HYPERIDX_H__

#include <exception>
#include <stdexcept>
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>

#ifdef _MSC_VER
#define DLL_EXPORT __declspec(dllexport)
#else
#define DLL_EXPORT
#endif

extern int hi__loglevel;

#define HI_LOG_TRACE 5
#define HI_LOG_DEBUG 4
#define HI_LOG_WARN 3
#define HI_LOG_ERROR 2
#define HI_LOG_NONE 0

#define hi_loglevel(x) {hi__loglevel = x;}

// Serialized so that lines written from parallel loops do not interleave.
#define hi_log(x, y) _Pragma("omp critical(hi_log)") \
        { \
                if(hi__loglevel >= y) { \
                        std::cerr << std::setprecision(12) << x << std::endl; \
                } \
        }
#define hi_trace(x) hi_log("TRACE:   " << x, HI_LOG_TRACE)
#define hi_debug(x) hi_log("DEBUG:   " << x, HI_LOG_DEBUG)
#define hi_warn(x)  hi_log("WARNING: " << x, HI_LOG_WARN)
#define hi_error(x) hi_log("ERROR:   " << x, HI_LOG_ERROR)

#define hi_raise(t, x) {std::stringstream _ss; _ss << x; throw t(_ss.str());}
#define hi_argerr(x) hi_raise(std::invalid_argument, x)
#define hi_runerr(x) hi_raise(std::runtime_error, x)

namespace hyperidx {

    // Thrown when a requested index name is not in the catalog.
    class DLL_EXPORT UnknownIndexError : public std::invalid_argument {
    public:
        UnknownIndexError(const std::string &msg) : std::invalid_argument(msg) {}
    };

    // Thrown when a theme name is not one of the catalog's themes (or "all").
    class DLL_EXPORT UnknownThemeError : public std::invalid_argument {
    public:
        UnknownThemeError(const std::string &msg) : std::invalid_argument(msg) {}
    };

    // Thrown for malformed band/wavelength input. Fatal to the whole batch.
    class DLL_EXPORT InvalidInputError : public std::invalid_argument {
    public:
        InvalidInputError(const std::string &msg) : std::invalid_argument(msg) {}
    };

} // hyperidx

#define hi_unknownidx(x) hi_raise(hyperidx::UnknownIndexError, x)
#define hi_unknowntheme(x) hi_raise(hyperidx::UnknownThemeError, x)
#define hi_inputerr(x) hi_raise(hyperidx::InvalidInputError, x)

#endif
