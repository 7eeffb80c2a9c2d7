#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <vector>
#include <string>

#include "hyperidx.h"

namespace hyperidx {

    namespace util {

        /**
         * Provides utility methods for the command line and the file system.
         */
        class DLL_EXPORT Util {
        public:

            /**
             * Split a comma-delimited string into a list of trimmed, non-empty items.
             */
            static void splitString(const std::string &str, std::vector<std::string> &lst);

            /**
             * Split a comma-delimited string into a list of doubles. Throws
             * InvalidInputError if an item is not a number.
             */
            static void parseDoubles(const std::string &str, std::vector<double> &values);

            // Split "key=value" into its parts. Throws InvalidInputError if
            // either side is empty.
            static void splitAssignment(const std::string &str, std::string &key, std::string &value);

            /**
             * Prints out a status message; a percentage representing current
             * of total steps.
             */
            static void status(int step, int of, const std::string &message = "", bool end = false);

            // Create the directory (and its parents) if it does not exist.
            static bool mkdir(const std::string &dir);

        };

    } // util

} // hyperidx

#endif
