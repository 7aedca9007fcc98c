#ifndef kapilainterpreter_h_included
#define kapilainterpreter_h_included

#include "kapila.h"

#include <cstddef>
#include <string>

namespace kapila {

// Outer interpreter for the kernel: splits a line into tokens, pushes
// literals, and executes everything else through the primitive dictionary.
class Interpreter {
public:
    explicit Interpreter(Session& s): session_(s) {}

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    Session& session() { return session_; }

    void setInput(const std::string& line);
    bool nextToken(std::string& token);

    // Push token as an integer or float literal.  Returns false if it isn't one.
    bool pushNumber(const std::string& token);

    // Interpret every token of line.  Returns false on `bye`.  A fault
    // propagates to the caller, leaving the rest of the line unread.
    bool interpret(const std::string& line);

    // interpret() for the interactive loop.  A fault is reported on the
    // session output and empties the stack.  Prints `ok` unless the line
    // said `bye`.
    bool evaluate(const std::string& line);

    void words();

private:
    bool interpretInput();

    Session&    session_;
    std::string inputBuffer;
    std::size_t inputOffset = 0;
};

} // namespace kapila

#endif // kapilainterpreter_h_included
