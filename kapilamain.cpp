/****

kapila: An Interactive Driver for the Kapila Kernel
===================================================

----

This is free and unencumbered software released into the public domain.

Anyone is free to copy, modify, publish, use, compile, sell, or distribute this
software, either in source code form or as a compiled binary, for any purpose,
commercial or non-commercial, and by any means.

In jurisdictions that recognize copyright laws, the author or authors of this
software dedicate any and all copyright interest in the software to the public
domain. We make this dedication for the benefit of the public at large and to
the detriment of our heirs and successors. We intend this dedication to be an
overt act of relinquishment in perpetuity of all present and future rights to
this software under copyright law.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  IN NO EVENT SHALL THE
AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

For more information, please refer to <http://unlicense.org/>

----

This is the `kapila` executable.  It reads lines, from files named on the
command line and then from the terminal, and hands each one to the outer
interpreter in `kapilainterpreter.cpp`.

****/

#include "kapilainterpreter.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

/****

The driver can use the GNU Readline library for user input if it is available.

The CMake build will detect whether the library is available, and if so define
`KAPILA_USE_READLINE`.  You can pass `-DKAPILA_DISABLE_READLINE=ON` to `cmake`
to prevent it from searching for the library.

****/

#ifdef KAPILA_USE_READLINE
#include "readline/readline.h"
#include "readline/history.h"
#endif

namespace {

using kapila::Interpreter;
using kapila::RuntimeFault;
using kapila::Session;

/****

`refill()` reads a line from the user.  We use GNU Readline if configured to
do so.  Otherwise we use `std::getline()`.

****/

bool refill(std::string& line) {
#ifdef KAPILA_USE_READLINE
    char* input = readline("");
    if (input) {
        line = input;
        if (*input)
            add_history(input);
        std::free(input);
        return true;
    }
    return false;
#else
    return static_cast<bool>(std::getline(std::cin, line));
#endif
}

// The interactive loop.  Returns when input ends or a line says `bye`.
void quit(Interpreter& interpreter) {
    std::string line;
    while (refill(line)) {
        if (!interpreter.evaluate(line))
            break;
    }
}

/****

Files named on the command line are interpreted line by line before the
interactive loop starts.  A fault in a file stops the program with a failure
status, and `bye` in a file ends the program without entering the loop.

****/

enum class FileResult {
    Done,
    Bye,
    Failed
};

FileResult runFile(Interpreter& interpreter, const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "kapila: unable to open \"" << path << "\"" << std::endl;
        return FileResult::Failed;
    }

    std::string line;
    while (std::getline(file, line)) {
        try {
            if (!interpreter.interpret(line)) {
                std::cout << std::flush;
                return FileResult::Bye;
            }
        }
        catch (const RuntimeFault& fault) {
            std::cout << std::flush;
            std::cerr << "kapila: " << path << ": " << fault.what() << std::endl;
            return FileResult::Failed;
        }
    }
    std::cout << std::flush;
    return FileResult::Done;
}

} // end anonymous namespace

int main(int argc, const char** argv) {
    try {
        Session session;
        Interpreter interpreter(session);

        auto trace = std::getenv("KAPILA_TRACE");
        session.setTrace(trace != nullptr && *trace != '\0' && *trace != '0');

        for (int i = 1; i < argc; ++i) {
            switch (runFile(interpreter, argv[i])) {
                case FileResult::Failed: return EXIT_FAILURE;
                case FileResult::Bye:    return EXIT_SUCCESS;
                case FileResult::Done:   break;
            }
        }

        std::cout << "kapila " << kapilaVersion << "\n"
                  << "Type \"bye\" to exit." << std::endl;
        quit(interpreter);
        std::cout << std::endl;
        return EXIT_SUCCESS;
    }
    catch (const std::exception& ex) {
        std::cerr << "kapila: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
