/****

The Kapila Outer Interpreter
============================

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

The outer interpreter is the smallest useful front end for the kernel in
`kapila.cpp`.  It splits a line on whitespace, and for each token either
pushes a literal or executes a primitive from the kernel's dictionary:

    5 3 add print
    "ಕನ್ನಡ" length println

It knows nothing about word definitions, variables, or infix expressions.
Those belong to the language front end, which drives the same kernel.

The interpreter doesn't read input itself.  The driver in `kapilamain.cpp`
hands it one line at a time, from a file or from the terminal.

****/

#include "kapilainterpreter.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>

namespace kapila {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool looksNumeric(const std::string& token) {
    std::size_t i = 0;
    if (i < token.size() && (token[i] == '-' || token[i] == '+'))
        ++i;
    if (i < token.size() && token[i] == '.')
        ++i;
    return i < token.size() && token[i] >= '0' && token[i] <= '9';
}

} // end anonymous namespace

/****

The input buffer is a `std::string` holding the current line, with an offset
to the next unread character.

`nextToken()` skips leading whitespace and returns the next token.  A token
that starts with a double quote runs to the next double quote, so a text
literal may contain spaces.  The quotes are kept on the token so the caller
can tell a text literal from a word.

An unterminated literal runs to the end of the line.

****/

void Interpreter::setInput(const std::string& line) {
    inputBuffer = line;
    inputOffset = 0;
}

bool Interpreter::nextToken(std::string& token) {
    auto inputSize = inputBuffer.size();

    while (inputOffset < inputSize && isSpace(inputBuffer[inputOffset]))
        ++inputOffset;

    if (inputOffset >= inputSize)
        return false;

    auto start = inputOffset;
    if (inputBuffer[inputOffset] == '"') {
        ++inputOffset;
        while (inputOffset < inputSize && inputBuffer[inputOffset] != '"')
            ++inputOffset;
        if (inputOffset < inputSize)
            ++inputOffset;  // closing quote
    }
    else {
        while (inputOffset < inputSize && !isSpace(inputBuffer[inputOffset]))
            ++inputOffset;
    }

    token = inputBuffer.substr(start, inputOffset - start);
    return true;
}

/****

A numeric token is tried as a 64-bit integer first.  If it has a fraction or
an exponent, or is too big for an integer, it is read again as a float.

A float literal out of the range of `double` is still a number.  `strtod()`
gives back infinity (or zero, for a tiny one) and sets `errno`; we push what
it returned rather than reporting an unknown word.

****/

bool Interpreter::pushNumber(const std::string& token) {
    if (!looksNumeric(token))
        return false;

    auto begin = token.c_str();
    char* end = nullptr;

    errno = 0;
    auto n = std::strtoll(begin, &end, 10);
    if (*end == '\0' && errno == 0) {
        session_.pushInteger(static_cast<std::int64_t>(n));
        return true;
    }

    auto x = std::strtod(begin, &end);
    if (*end == '\0') {
        session_.pushFloat(x);
        return true;
    }

    return false;
}

void Interpreter::words() {
    auto& out = session_.output();
    for (auto& p: primitives())
        out << p.name << " ";
    out << std::endl;
}

/****

`interpret()` processes the tokens of a line in order.  Text literals are
copied into the session's tracker, because the input buffer is reused for
the next line.

It returns `false` when it sees `bye`.

****/

bool Interpreter::interpret(const std::string& line) {
    setInput(line);
    return interpretInput();
}

bool Interpreter::interpretInput() {
    std::string token;
    while (nextToken(token)) {
        if (token[0] == '"') {
            auto closed = token.size() > 1 && token.back() == '"';
            auto length = token.size() - (closed ? 2 : 1);
            session_.pushOwnedText(token.substr(1, length));
        }
        else if (token == "bye") {
            return false;
        }
        else if (token == "words") {
            words();
        }
        else if (!pushNumber(token)) {
            execute(session_, token);
        }
    }
    return true;
}

/****

`evaluate()` is one turn of the interactive loop.  A fault prints a message,
empties the stack, and carries on.  The session's allocations are kept, since
values already printed or still held elsewhere may refer to them.

****/

bool Interpreter::evaluate(const std::string& line) {
    auto& out = session_.output();
    try {
        if (!interpret(line))
            return false;
    }
    catch (const RuntimeFault& fault) {
        out << std::endl << "<<< Error: " << fault.what() << " >>>" << std::endl;
        session_.stack().clear();
    }

    out << "  ok" << std::endl;
    return true;
}

} // namespace kapila
