/****

Kapila: A Tagged-Value Stack Machine in C++
===========================================

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

Kapila (ಕಪಿಲ) is a small concatenative language whose words may be written in
Kannada or in English.  This file is its kernel: the part of the system that
knows what a value is, how the operand stack behaves, and what each primitive
word does to that stack.  Everything that turns program text into a sequence
of primitive invocations lives elsewhere; the kernel only sees the invocations.

As in a Forth kernel, the design is a stack of cells and a table of native
routines that manipulate it.  Unlike a Forth kernel, our cells are not bare
machine words.  Each cell is a tagged `Value` that is one of an integer, a
floating-point number, a boolean, a piece of UTF-8 text, or a list of values.

Memory management is deliberately simple.  Text and list storage is obtained
from an `AllocationTracker`, which owns every buffer it hands out and frees
them all at once when the session ends.  Values never free anything, so a
value copied around the stack can never dangle while the session is alive.
The price is that short-lived intermediate strings stay allocated until the
end of the session, which is fine for the short scripts Kapila is meant for.

The file is written to be read top to bottom, and the large comment blocks
are Markdown.

We are writing C++ conforming to the C++14 standard.

----

The Code
--------

We include `kapila.h`, which declares the public types and primitive words and
includes the `kapilaconfig.h` header produced by the CMake build.

****/

#include "kapila.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace kapila {

/****

Names
-----

Diagnostics mention fault kinds and value types by name, so we keep the
spellings in one place.

****/

const char* faultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::StackUnderflow:  return "stack underflow";
        case FaultKind::StackOverflow:   return "stack overflow";
        case FaultKind::OutOfMemory:     return "out of memory";
        case FaultKind::TypeMismatch:    return "type mismatch";
        case FaultKind::DivideByZero:    return "zero divisor";
        case FaultKind::BadOperand:      return "bad operand";
        case FaultKind::IndexOutOfRange: return "index out of range";
        case FaultKind::FileError:       return "file error";
        case FaultKind::UnknownWord:     return "unknown word";
    }
    return "fault";
}

const char* typeName(ValueType type) {
    switch (type) {
        case ValueType::Integer: return "integer";
        case ValueType::Float:   return "float";
        case ValueType::Boolean: return "boolean";
        case ValueType::Text:    return "text";
        case ValueType::List:    return "list";
    }
    return "value";
}

/****

Runtime Checks
--------------

A bare C-style runtime trusts its caller completely.  Popping an empty stack
reads whatever happens to be below it, and asking for the boolean inside an
integer just reinterprets the bits.  We would rather be told about our
mistakes, so every primitive checks its preconditions before it touches the
stack and throws a `RuntimeFault` if they don't hold.

Because the checks happen before anything is popped, a primitive that faults
leaves the stack exactly as it found it.  The driver can report the error and
carry on with the same session.

Each of the macros below takes the name of the word being executed, so the
message reads like `dup: stack underflow`.

****/

#define RUNTIME_FAULT(kind, msg)          do { throw RuntimeFault(kind, msg); } while (0)
#define RUNTIME_FAULT_IF(cond, kind, msg) do { if (cond) RUNTIME_FAULT(kind, msg); } while (0)
#define REQUIRE_DEPTH(s, n, name)         requireDepth(s, n, name)
#define REQUIRE_AVAILABLE(s, n, name)     requireAvailable(s, n, name)

namespace {

void requireDepth(const Session& s, std::size_t n, const char* name) {
    RUNTIME_FAULT_IF(s.stack().depth() < n,
                     FaultKind::StackUnderflow,
                     std::string(name) + ": stack underflow");
}

void requireAvailable(const Session& s, std::size_t n, const char* name) {
    RUNTIME_FAULT_IF(s.stack().depth() + n > s.stack().capacity(),
                     FaultKind::StackOverflow,
                     std::string(name) + ": stack overflow");
}

std::string mismatch(const char* name, const Value& left, const Value& right) {
    return std::string(name) + ": cannot apply to " + typeName(left.type())
        + " and " + typeName(right.type());
}

void requireNumeric(const Value& left, const Value& right, const char* name) {
    RUNTIME_FAULT_IF(!left.isNumeric() || !right.isNumeric(),
                     FaultKind::TypeMismatch, mismatch(name, left, right));
}

void requireBoolean(const Value& v, const char* name) {
    RUNTIME_FAULT_IF(!v.isBoolean(),
                     FaultKind::TypeMismatch,
                     std::string(name) + ": expected boolean, got " + typeName(v.type()));
}

/****

Some conditions are not programming errors at the language level.  Asking for
character 10 of a five-character string, or reading a file that isn't there,
produces a harmless default value (an empty text, integer zero, or `false`)
so that a Kapila script keeps running.

A host embedding the kernel as a library usually wants to know when that
happened.  In `FailureMode::Strict`, `silentFailure()` throws instead of
returning, and the caller never gets to push its default.

****/

void silentFailure(const Session& s, FaultKind kind, const std::string& msg) {
    if (s.failureMode() == FailureMode::Strict)
        throw RuntimeFault(kind, msg);
}

} // end anonymous namespace

/****

Values
------

A `Value` is a tag plus a union.  The union members are never read directly
from outside the class; the `as...()` accessors check the tag first and throw
a `TypeMismatch` fault if it is wrong.

****/

Value Value::makeInteger(std::int64_t n) {
    Value v;
    v.type_ = ValueType::Integer;
    v.integer_ = n;
    return v;
}

Value Value::makeFloat(double x) {
    Value v;
    v.type_ = ValueType::Float;
    v.float_ = x;
    return v;
}

Value Value::makeBoolean(bool b) {
    Value v;
    v.type_ = ValueType::Boolean;
    v.boolean_ = b;
    return v;
}

Value Value::makeText(const char* bytes, std::size_t length, bool owned) {
    Value v;
    v.type_ = ValueType::Text;
    v.text_.bytes = bytes;
    v.text_.length = length;
    v.text_.owned = owned;
    return v;
}

Value Value::makeList(List* list) {
    Value v;
    v.type_ = ValueType::List;
    v.list_ = list;
    return v;
}

namespace {

[[noreturn]] void wrongType(ValueType expected, ValueType actual) {
    throw RuntimeFault(FaultKind::TypeMismatch,
                       std::string("expected ") + typeName(expected) + ", got " + typeName(actual));
}

} // end anonymous namespace

std::int64_t Value::asInteger() const {
    if (type_ != ValueType::Integer) wrongType(ValueType::Integer, type_);
    return integer_;
}

double Value::asFloat() const {
    if (type_ != ValueType::Float) wrongType(ValueType::Float, type_);
    return float_;
}

bool Value::asBoolean() const {
    if (type_ != ValueType::Boolean) wrongType(ValueType::Boolean, type_);
    return boolean_;
}

const Text& Value::asText() const {
    if (type_ != ValueType::Text) wrongType(ValueType::Text, type_);
    return text_;
}

List* Value::asList() const {
    if (type_ != ValueType::List) wrongType(ValueType::List, type_);
    return list_;
}

double Value::toNumber() const {
    if (type_ == ValueType::Float)
        return float_;
    if (type_ == ValueType::Integer)
        return static_cast<double>(integer_);
    throw RuntimeFault(FaultKind::TypeMismatch,
                       std::string("expected number, got ") + typeName(type_));
}

std::string Value::textString() const {
    auto& t = asText();
    return std::string(t.bytes, t.length);
}

/****

Allocation Tracker
------------------

The tracker is an insertion-ordered list of buffers.  Each buffer is held by a
`std::unique_ptr`, so `releaseAll()` is just clearing the vector, and no
buffer can be freed twice.  There is no fixed ceiling on the number of
buffers.  A byte limit can be configured, which is mostly useful for testing
what happens when memory runs out.

****/

void* AllocationTracker::allocate(std::size_t size) {
    RUNTIME_FAULT_IF(limit_ != 0 && (size > limit_ || bytes > limit_ - size),
                     FaultKind::OutOfMemory,
                     "allocate: allocation limit exceeded");
    try {
        auto buffer = std::make_unique<unsigned char[]>(size == 0 ? 1 : size);
        auto p = buffer.get();
        buffers.push_back(std::move(buffer));
        bytes += size;
        return p;
    }
    catch (const std::bad_alloc&) {
        RUNTIME_FAULT(FaultKind::OutOfMemory, "allocate: out of memory");
    }
}

Value AllocationTracker::duplicateText(const char* bytes, std::size_t length) {
    auto copy = static_cast<char*>(allocate(length + 1));
    if (length > 0)
        std::memcpy(copy, bytes, length);
    copy[length] = '\0';
    return Value::makeText(copy, length, true);
}

void AllocationTracker::releaseAll() {
    buffers.clear();
    bytes = 0;
}

/****

Operand Stack
-------------

The stack is a `std::vector<Value>` with a hard capacity.  We reserve the full
capacity up front, so pushing never reallocates and references obtained with
`at()` stay valid across a push.

The primitives below check depth themselves so that they can name the word in
the message, but the stack checks again so that nothing can read past the
bottom.

****/

OperandStack::OperandStack(std::size_t capacity): capacity_(capacity) {
    cells.reserve(capacity_);
}

void OperandStack::push(const Value& v) {
    RUNTIME_FAULT_IF(cells.size() >= capacity_, FaultKind::StackOverflow, "push: stack overflow");
    cells.push_back(v);
}

Value OperandStack::pop() {
    RUNTIME_FAULT_IF(cells.empty(), FaultKind::StackUnderflow, "pop: stack underflow");
    auto v = cells.back();
    cells.pop_back();
    return v;
}

Value OperandStack::peek() const {
    RUNTIME_FAULT_IF(cells.empty(), FaultKind::StackUnderflow, "peek: stack underflow");
    return cells.back();
}

Value& OperandStack::at(std::size_t n) {
    RUNTIME_FAULT_IF(n >= cells.size(), FaultKind::StackUnderflow, "at: stack underflow");
    return cells[cells.size() - 1 - n];
}

const Value& OperandStack::at(std::size_t n) const {
    RUNTIME_FAULT_IF(n >= cells.size(), FaultKind::StackUnderflow, "at: stack underflow");
    return cells[cells.size() - 1 - n];
}

/****

Sessions
--------

A `Session` is one initialize-to-finalize lifetime of a stack and a tracker.
Each session is independent of every other, so tests can simply construct a
fresh one.  A session is not thread-safe; keep each one on a single thread.

The push functions are the surface a driver uses to put literals on the stack.
`pushText()` borrows its argument, which must outlive the session (a string
literal, typically).  `pushOwnedText()` copies into the tracker.

****/

Session::Session(std::ostream& out, std::size_t stackCapacity)
    : stack_(stackCapacity), out(&out) {
}

Session::~Session() {
    finalize();
}

void Session::init() {
    stack_.clear();
    tracker_.releaseAll();
}

void Session::finalize() {
    tracker_.releaseAll();
    stack_.clear();
}

void Session::pushInteger(std::int64_t n) {
    stack_.push(Value::makeInteger(n));
}

void Session::pushFloat(double x) {
    stack_.push(Value::makeFloat(x));
}

void Session::pushBoolean(bool b) {
    stack_.push(Value::makeBoolean(b));
}

void Session::pushText(const char* s) {
    stack_.push(Value::makeText(s, std::strlen(s), false));
}

void Session::pushText(const char* bytes, std::size_t length) {
    stack_.push(Value::makeText(bytes, length, false));
}

void Session::pushOwnedText(const std::string& s) {
    REQUIRE_AVAILABLE(*this, 1, "push");
    stack_.push(tracker_.duplicateText(s.data(), s.size()));
}

void Session::pushList(List* list) {
    stack_.push(Value::makeList(list));
}

void Session::pushValue(const Value& v) {
    stack_.push(v);
}

Value Session::pop() {
    return stack_.pop();
}

Value Session::peek() const {
    return stack_.peek();
}

/****

A list is a small header (`items`, `length`, `capacity`) plus an array of
values, both allocated from the tracker.  When the array is full we allocate
one twice the size, copy the items over, and point the header at it.  The old
array stays in the tracker until the session ends.

Because every stack slot that holds the list holds the same header pointer,
appending to a list is visible through all of them.

****/

List* Session::newList() {
    auto list = tracker_.allocate<List>(1);
    list->items = tracker_.allocate<Value>(KAPILA_LIST_INITIAL_CAPACITY);
    list->length = 0;
    list->capacity = KAPILA_LIST_INITIAL_CAPACITY;
    return list;
}

void Session::appendItem(List* list, const Value& v) {
    if (list->length >= list->capacity) {
        auto newCapacity = list->capacity == 0 ? std::size_t(KAPILA_LIST_INITIAL_CAPACITY)
                                               : list->capacity * 2;
        auto newItems = tracker_.allocate<Value>(newCapacity);
        std::copy(list->items, list->items + list->length, newItems);
        list->items = newItems;
        list->capacity = newCapacity;
    }
    list->items[list->length++] = v;
}

/****

Arithmetic Primitives
---------------------

Binary operators find their operands in stack order `left right`, so the
right operand is on top.  Following the Forth convention, we don't pop both
operands and push a result.  We check everything first, compute the result,
drop the right operand and overwrite the left one.

The numeric promotion rule is the usual one: if either side is a float, the
computation is done in floating point; otherwise it is done on 64-bit
integers.  Integer overflow wraps around.  We do the arithmetic on unsigned
values so that wrapping is well-defined rather than undefined behavior.

****/

namespace {

std::int64_t wrap(std::uint64_t x) {
    return static_cast<std::int64_t>(x);
}

template<typename IntOp, typename FloatOp>
void arithmetic(Session& s, const char* name, IntOp intOp, FloatOp floatOp) {
    REQUIRE_DEPTH(s, 2, name);
    auto& st = s.stack();
    auto right = st.at(0);
    auto left = st.at(1);
    requireNumeric(left, right, name);

    Value result;
    if (left.isFloat() || right.isFloat()) {
        result = Value::makeFloat(floatOp(left.toNumber(), right.toNumber()));
    }
    else {
        auto a = static_cast<std::uint64_t>(left.asInteger());
        auto b = static_cast<std::uint64_t>(right.asInteger());
        result = Value::makeInteger(wrap(intOp(a, b)));
    }

    st.pop();
    st.at(0) = result;
}

} // end anonymous namespace

// add ( n1 n2 -- n3 )
void add(Session& s) {
    arithmetic(s, "add",
               [](std::uint64_t a, std::uint64_t b) { return a + b; },
               [](double a, double b) { return a + b; });
}

// sub ( n1 n2 -- n3 )
void subtract(Session& s) {
    arithmetic(s, "sub",
               [](std::uint64_t a, std::uint64_t b) { return a - b; },
               [](double a, double b) { return a - b; });
}

// mul ( n1 n2 -- n3 )
void multiply(Session& s) {
    arithmetic(s, "mul",
               [](std::uint64_t a, std::uint64_t b) { return a * b; },
               [](double a, double b) { return a * b; });
}

/****

Division always produces a float, even for two integers: `7 2 div` is `3.5`.
There is no separate integer division word.  Dividing by zero is not an error;
it gives an IEEE infinity or NaN.

****/

// div ( n1 n2 -- r )
void divide(Session& s) {
    REQUIRE_DEPTH(s, 2, "div");
    auto& st = s.stack();
    auto right = st.at(0);
    auto left = st.at(1);
    requireNumeric(left, right, "div");
    auto result = Value::makeFloat(left.toNumber() / right.toNumber());
    st.pop();
    st.at(0) = result;
}

/****

Modulo is only defined on integers.  A float operand is a type mismatch rather
than a silent truncation, and a zero divisor is a fault.  The result takes the
sign of the dividend, as C++ `%` does.

`INT64_MIN % -1` overflows in C++, even though the mathematical answer is just
zero, so we special-case a divisor of -1.

****/

// mod ( n1 n2 -- n3 )
void modulo(Session& s) {
    REQUIRE_DEPTH(s, 2, "mod");
    auto& st = s.stack();
    auto right = st.at(0);
    auto left = st.at(1);
    RUNTIME_FAULT_IF(!left.isInteger() || !right.isInteger(),
                     FaultKind::TypeMismatch, mismatch("mod", left, right));
    auto n2 = right.asInteger();
    auto n1 = left.asInteger();
    RUNTIME_FAULT_IF(n2 == 0, FaultKind::DivideByZero, "mod: zero divisor");
    auto result = Value::makeInteger(n2 == -1 ? 0 : n1 % n2);
    st.pop();
    st.at(0) = result;
}

/****

Comparison Primitives
---------------------

Ordering comparisons accept two numbers (compared after promotion to float)
or two texts (compared byte by byte, which for UTF-8 is code point order).
Anything else is a type mismatch.

Equality is more forgiving: values of different kinds are simply not equal.
Lists are equal only if they are the same list.

****/

namespace {

int compareText(const Text& a, const Text& b) {
    auto n = std::min(a.length, b.length);
    auto c = n == 0 ? 0 : std::memcmp(a.bytes, b.bytes, n);
    if (c != 0)
        return c;
    if (a.length == b.length)
        return 0;
    return a.length < b.length ? -1 : 1;
}

template<typename Compare>
void ordered(Session& s, const char* name, Compare cmp) {
    REQUIRE_DEPTH(s, 2, name);
    auto& st = s.stack();
    auto right = st.at(0);
    auto left = st.at(1);

    bool result = false;
    if (left.isNumeric() && right.isNumeric())
        result = cmp(left.toNumber(), right.toNumber());
    else if (left.isText() && right.isText())
        result = cmp(compareText(left.asText(), right.asText()), 0);
    else
        RUNTIME_FAULT(FaultKind::TypeMismatch, mismatch(name, left, right));

    st.pop();
    st.at(0) = Value::makeBoolean(result);
}

bool valuesEqual(const Value& a, const Value& b) {
    if (a.isNumeric() && b.isNumeric())
        return a.toNumber() == b.toNumber();
    if (a.type() != b.type())
        return false;
    switch (a.type()) {
        case ValueType::Boolean: return a.asBoolean() == b.asBoolean();
        case ValueType::Text:    return compareText(a.asText(), b.asText()) == 0;
        case ValueType::List:    return a.asList() == b.asList();
        default:                 return false;
    }
}

} // end anonymous namespace

// < ( x1 x2 -- flag )
void less(Session& s) {
    ordered(s, "<", [](auto a, auto b) { return a < b; });
}

// > ( x1 x2 -- flag )
void greater(Session& s) {
    ordered(s, ">", [](auto a, auto b) { return a > b; });
}

// <= ( x1 x2 -- flag )
void lessOrEqual(Session& s) {
    ordered(s, "<=", [](auto a, auto b) { return a <= b; });
}

// >= ( x1 x2 -- flag )
void greaterOrEqual(Session& s) {
    ordered(s, ">=", [](auto a, auto b) { return a >= b; });
}

// = ( x1 x2 -- flag )
void equal(Session& s) {
    REQUIRE_DEPTH(s, 2, "=");
    auto& st = s.stack();
    auto result = valuesEqual(st.at(1), st.at(0));
    st.pop();
    st.at(0) = Value::makeBoolean(result);
}

// != ( x1 x2 -- flag )
void notEqual(Session& s) {
    equal(s);
    logicalNot(s);
}

/****

Logic Primitives
----------------

These work on booleans only.  Kapila has no notion of "truthy" integers.

****/

// and ( flag1 flag2 -- flag3 )
void logicalAnd(Session& s) {
    REQUIRE_DEPTH(s, 2, "and");
    auto& st = s.stack();
    requireBoolean(st.at(0), "and");
    requireBoolean(st.at(1), "and");
    auto b = st.pop().asBoolean();
    st.at(0) = Value::makeBoolean(st.at(0).asBoolean() && b);
}

// or ( flag1 flag2 -- flag3 )
void logicalOr(Session& s) {
    REQUIRE_DEPTH(s, 2, "or");
    auto& st = s.stack();
    requireBoolean(st.at(0), "or");
    requireBoolean(st.at(1), "or");
    auto b = st.pop().asBoolean();
    st.at(0) = Value::makeBoolean(st.at(0).asBoolean() || b);
}

// not ( flag1 -- flag2 )
void logicalNot(Session& s) {
    REQUIRE_DEPTH(s, 1, "not");
    auto& top = s.stack().at(0);
    requireBoolean(top, "not");
    top = Value::makeBoolean(!top.asBoolean());
}

/****

Stack Manipulation Primitives
-----------------------------

As in Forth, we don't change the stack depth any more than necessary.  `swap`
and `rot` only rearrange slots.

****/

// dup ( x -- x x )
void dup(Session& s) {
    REQUIRE_DEPTH(s, 1, "dup");
    REQUIRE_AVAILABLE(s, 1, "dup");
    auto top = s.stack().at(0);
    s.stack().push(top);
}

// drop ( x -- )
void drop(Session& s) {
    REQUIRE_DEPTH(s, 1, "drop");
    s.stack().pop();
}

// swap ( x1 x2 -- x2 x1 )
void swap(Session& s) {
    REQUIRE_DEPTH(s, 2, "swap");
    auto& st = s.stack();
    std::swap(st.at(0), st.at(1));
}

// over ( x1 x2 -- x1 x2 x1 )
void over(Session& s) {
    REQUIRE_DEPTH(s, 2, "over");
    REQUIRE_AVAILABLE(s, 1, "over");
    auto second = s.stack().at(1);
    s.stack().push(second);
}

// rot ( x1 x2 x3 -- x2 x3 x1 )
void rot(Session& s) {
    REQUIRE_DEPTH(s, 3, "rot");
    auto& st = s.stack();
    auto x1 = st.at(2);
    st.at(2) = st.at(1);
    st.at(1) = st.at(0);
    st.at(0) = x1;
}

// depth ( -- n )
void depth(Session& s) {
    REQUIRE_AVAILABLE(s, 1, "depth");
    s.pushInteger(static_cast<std::int64_t>(s.depth()));
}

// true ( -- flag )
void pushTrue(Session& s) {
    REQUIRE_AVAILABLE(s, 1, "true");
    s.pushBoolean(true);
}

// false ( -- flag )
void pushFalse(Session& s) {
    REQUIRE_AVAILABLE(s, 1, "false");
    s.pushBoolean(false);
}

/****

Text Primitives
---------------

Text is UTF-8.  Lengths and indexes count Unicode scalar values, not bytes.
Every byte of a well-formed UTF-8 sequence except the first has the bit
pattern `10xxxxxx`, so counting the bytes that *don't* look like that counts
the characters.

The leading byte of a sequence also tells us how long it is:

    0xxxxxxx  1 byte
    110xxxxx  2 bytes
    1110xxxx  3 bytes
    11110xxx  4 bytes

****/

namespace {

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::size_t sequenceLength(char lead) {
    auto c = static_cast<unsigned char>(lead);
    if ((c & 0x80) == 0x00) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

Value emptyText() {
    return Value::makeText("", 0, false);
}

} // end anonymous namespace

std::size_t utf8Length(const char* bytes, std::size_t length) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < length; ++i) {
        if (!isContinuationByte(bytes[i]))
            ++count;
    }
    return count;
}

// text-length ( text -- n )
void textLength(Session& s) {
    REQUIRE_DEPTH(s, 1, "text-length");
    auto& top = s.stack().at(0);
    std::int64_t n = 0;
    if (top.isText()) {
        auto& t = top.asText();
        n = static_cast<std::int64_t>(utf8Length(t.bytes, t.length));
    }
    else {
        silentFailure(s, FaultKind::BadOperand, "text-length: expected text");
    }
    top = Value::makeInteger(n);
}

/****

`concatenate` never modifies its inputs.  It allocates a new buffer big
enough for both, plus a terminating null so that the result can be handed to
anything expecting a C string.

****/

// concatenate ( text1 text2 -- text3 )
void concatenate(Session& s) {
    REQUIRE_DEPTH(s, 2, "concatenate");
    auto& st = s.stack();
    auto right = st.at(0);
    auto left = st.at(1);

    auto result = emptyText();
    if (left.isText() && right.isText()) {
        auto& a = left.asText();
        auto& b = right.asText();
        auto length = a.length + b.length;
        auto buffer = static_cast<char*>(s.tracker().allocate(length + 1));
        std::copy(a.bytes, a.bytes + a.length, buffer);
        std::copy(b.bytes, b.bytes + b.length, buffer + a.length);
        buffer[length] = '\0';
        result = Value::makeText(buffer, length, true);
    }
    else {
        silentFailure(s, FaultKind::BadOperand, mismatch("concatenate", left, right));
    }

    st.pop();
    st.at(0) = result;
}

/****

`character-at` walks forward over the text counting leading bytes until it
reaches the one that starts the requested character, then copies exactly that
one character into a new buffer.  A truncated sequence at the very end of the
text is clamped to the bytes that are actually there.

****/

// character-at ( text n -- text' )
void characterAt(Session& s) {
    REQUIRE_DEPTH(s, 2, "character-at");
    auto& st = s.stack();
    auto index = st.at(0);
    auto text = st.at(1);

    auto result = emptyText();
    if (!text.isText() || !index.isInteger()) {
        silentFailure(s, FaultKind::BadOperand, mismatch("character-at", text, index));
    }
    else if (index.asInteger() < 0) {
        silentFailure(s, FaultKind::IndexOutOfRange, "character-at: negative index");
    }
    else {
        auto& t = text.asText();
        auto target = static_cast<std::uint64_t>(index.asInteger());
        std::uint64_t count = 0;
        std::size_t pos = 0;
        while (pos < t.length) {
            if (!isContinuationByte(t.bytes[pos])) {
                if (count == target)
                    break;
                ++count;
            }
            ++pos;
        }

        if (pos < t.length) {
            auto n = std::min(sequenceLength(t.bytes[pos]), t.length - pos);
            result = s.tracker().duplicateText(t.bytes + pos, n);
        }
        else {
            silentFailure(s, FaultKind::IndexOutOfRange, "character-at: index out of range");
        }
    }

    st.pop();
    st.at(0) = result;
}

/****

List Primitives
---------------

A new list starts with room for eight items.  `push-item` appends in place and
leaves the *same* list on the stack, so

    list-new dup 1 push-item drop length

gives `1`: the copy made by `dup` sees the append.  `rest` is the exception.
It always builds a new list and never shares storage with its source.

Out-of-range lookups produce integer zero.

****/

// list-new ( -- list )
void listNew(Session& s) {
    REQUIRE_AVAILABLE(s, 1, "list-new");
    s.pushList(s.newList());
}

// push-item ( list x -- list )
void listPush(Session& s) {
    REQUIRE_DEPTH(s, 2, "push-item");
    auto& st = s.stack();
    auto item = st.at(0);
    auto target = st.at(1);

    if (target.isList()) {
        s.appendItem(target.asList(), item);
        st.pop();
    }
    else {
        // Both operands are consumed and integer zero takes their place, so
        // the stack effect is the same as for a list.  A bare C runtime would
        // pop both and leave nothing.
        silentFailure(s, FaultKind::BadOperand,
                      std::string("push-item: expected list, got ") + typeName(target.type()));
        st.pop();
        st.at(0) = Value();
    }
}

// length ( list -- n ) or ( text -- n )
void length(Session& s) {
    REQUIRE_DEPTH(s, 1, "length");
    auto& top = s.stack().at(0);
    std::int64_t n = 0;
    if (top.isList()) {
        n = static_cast<std::int64_t>(top.asList()->length);
    }
    else if (top.isText()) {
        auto& t = top.asText();
        n = static_cast<std::int64_t>(utf8Length(t.bytes, t.length));
    }
    top = Value::makeInteger(n);
}

// index ( list n -- x )
void listIndex(Session& s) {
    REQUIRE_DEPTH(s, 2, "index");
    auto& st = s.stack();
    auto index = st.at(0);
    auto target = st.at(1);

    Value result;
    if (!target.isList() || !index.isInteger()) {
        silentFailure(s, FaultKind::BadOperand, mismatch("index", target, index));
    }
    else {
        auto list = target.asList();
        auto i = index.asInteger();
        if (i >= 0 && static_cast<std::uint64_t>(i) < list->length)
            result = list->items[i];
        else
            silentFailure(s, FaultKind::IndexOutOfRange, "index: index out of range");
    }

    st.pop();
    st.at(0) = result;
}

// first ( list -- x )
void first(Session& s) {
    REQUIRE_DEPTH(s, 1, "first");
    auto& top = s.stack().at(0);

    Value result;
    if (!top.isList())
        silentFailure(s, FaultKind::BadOperand, "first: expected list");
    else if (top.asList()->length == 0)
        silentFailure(s, FaultKind::IndexOutOfRange, "first: empty list");
    else
        result = top.asList()->items[0];

    top = result;
}

// rest ( list -- list' )
void rest(Session& s) {
    REQUIRE_DEPTH(s, 1, "rest");
    auto source = s.stack().at(0);
    if (!source.isList())
        silentFailure(s, FaultKind::BadOperand, "rest: expected list");

    auto result = s.newList();
    if (source.isList()) {
        auto list = source.asList();
        for (std::size_t i = 1; i < list->length; ++i)
            s.appendItem(result, list->items[i]);
    }

    s.stack().at(0) = Value::makeList(result);
}

/****

I/O Primitives
--------------

`print` writes to the session's output stream, which is `std::cout` unless
the host supplied another.

Booleans are printed in Kannada: ಸರಿ ("right") for true and ತಪ್ಪು ("wrong")
for false.  Floats use the stream's default general format, the equivalent of
`%g`.

A list prints as its items separated by spaces, inside square brackets.
Items are rendered straight from the list's storage, never by way of the
operand stack, so `.s` can show a full stack without overflowing it.  A list
that contains itself would recurse forever; we keep track of the lists we are
inside and print `[...]` for a repeat.

****/

namespace {

const char* const TrueText  = "\xe0\xb2\xb8\xe0\xb2\xb0\xe0\xb2\xbf";              // ಸರಿ
const char* const FalseText = "\xe0\xb2\xa4\xe0\xb2\xaa\xe0\xb3\x8d\xe0\xb2\xaa\xe0\xb3\x81";  // ತಪ್ಪು

void printValue(Session& s, const Value& v, std::vector<const List*>& enclosing) {
    auto& out = s.output();
    switch (v.type()) {
        case ValueType::Integer:
            out << v.asInteger();
            break;
        case ValueType::Float:
            out << v.asFloat();
            break;
        case ValueType::Boolean:
            out << (v.asBoolean() ? TrueText : FalseText);
            break;
        case ValueType::Text: {
            auto& t = v.asText();
            out.write(t.bytes, static_cast<std::streamsize>(t.length));
            break;
        }
        case ValueType::List: {
            auto list = v.asList();
            if (std::find(enclosing.begin(), enclosing.end(), list) != enclosing.end()) {
                out << "[...]";
                break;
            }
            enclosing.push_back(list);
            out << "[";
            for (std::size_t i = 0; i < list->length; ++i) {
                if (i > 0)
                    out << " ";
                printValue(s, list->items[i], enclosing);
            }
            out << "]";
            enclosing.pop_back();
            break;
        }
    }
}

} // end anonymous namespace

// print ( x -- )
void print(Session& s) {
    REQUIRE_DEPTH(s, 1, "print");
    std::vector<const List*> enclosing;
    auto v = s.pop();
    printValue(s, v, enclosing);
}

// println ( x -- )
void println(Session& s) {
    print(s);
    s.output() << std::endl;
}

// .s ( -- )
void dotS(Session& s) {
    auto& out = s.output();
    auto n = s.depth();
    out << "<" << n << "> ";
    for (auto i = n; i > 0; --i) {
        std::vector<const List*> enclosing;
        printValue(s, s.stack().at(i - 1), enclosing);
        out << " ";
    }
}

/****

`read-file` loads a whole file into one tracker-owned buffer, terminated with
a null byte.  It reads in chunks until end of file instead of asking the
stream for its size.  A directory can be opened like a file, and seeking to
its end reports a meaningless size, but reading from it puts the stream in a
bad state, which we report like any other unreadable file.  `write-file` writes the exact bytes of its text, embedded nulls
included.  Both use `std::fstream` objects, so the file is closed on every
path out of the function, including a throw.

If a file can't be opened the result is an empty text (for `read-file`) or
`false` (for `write-file`).

****/

// read-file ( path -- text )
void readFile(Session& s) {
    REQUIRE_DEPTH(s, 1, "read-file");
    auto& st = s.stack();
    auto path = st.at(0);

    if (!path.isText()) {
        silentFailure(s, FaultKind::BadOperand, "read-file: expected text path");
        st.at(0) = emptyText();
        return;
    }

    auto filename = path.textString();
    std::ifstream in(filename, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        silentFailure(s, FaultKind::FileError, "read-file: unable to open \"" + filename + "\"");
        st.at(0) = emptyText();
        return;
    }

    std::string contents;
    char chunk[4096];
    while (in.read(chunk, sizeof chunk) || in.gcount() > 0)
        contents.append(chunk, static_cast<std::size_t>(in.gcount()));
    if (in.bad()) {
        silentFailure(s, FaultKind::FileError, "read-file: unable to read \"" + filename + "\"");
        st.at(0) = emptyText();
        return;
    }

    st.at(0) = s.tracker().duplicateText(contents.data(), contents.size());
}

// write-file ( path text -- flag )
void writeFile(Session& s) {
    REQUIRE_DEPTH(s, 2, "write-file");
    auto& st = s.stack();
    auto content = st.at(0);
    auto path = st.at(1);

    auto ok = false;
    if (!path.isText() || !content.isText()) {
        silentFailure(s, FaultKind::BadOperand, mismatch("write-file", path, content));
    }
    else {
        auto filename = path.textString();
        std::ofstream out(filename, std::ios::out | std::ios::binary | std::ios::trunc);
        if (out.is_open()) {
            auto& t = content.asText();
            out.write(t.bytes, static_cast<std::streamsize>(t.length));
            out.close();
            ok = !out.fail();
        }
        if (!ok)
            silentFailure(s, FaultKind::FileError, "write-file: unable to write \"" + filename + "\"");
    }

    st.pop();
    st.at(0) = Value::makeBoolean(ok);
}

/****

The Dictionary
--------------

A driver needs to turn a word it has read into a call.  The dictionary maps
names to native code.  Every primitive is registered under its English name,
a few short or symbolic spellings, and its Kannada name.  Lookup ignores the
case of ASCII letters, so `DUP` and `dup` are the same word.

The dictionary is a plain vector searched linearly from the front.  It has a
few dozen entries, and the driver looks each word up once per use.

****/

namespace {

std::vector<Primitive> buildPrimitives() {
    static const Primitive table[] = {
        // name                  code
        // ------------------------------------
        {"+",                    add},
        {"add",                  add},
        {"ಕೂಡು",                 add},
        {"ಕೂಡಿಸು",               add},
        {"-",                    subtract},
        {"sub",                  subtract},
        {"subtract",             subtract},
        {"ಕಳೆ",                  subtract},
        {"ಕಳೆಯಿರಿ",              subtract},
        {"*",                    multiply},
        {"mul",                  multiply},
        {"multiply",             multiply},
        {"ಗುಣಿಸು",               multiply},
        {"ಗುಣಾಕಾರ",              multiply},
        {"/",                    divide},
        {"div",                  divide},
        {"divide",               divide},
        {"ಭಾಗಿಸು",               divide},
        {"ಭಾಗಾಕಾರ",              divide},
        {"%",                    modulo},
        {"mod",                  modulo},
        {"modulo",               modulo},
        {"ಶೇಷ",                  modulo},

        {"<",                    less},
        {"less",                 less},
        {"ಕಿರಿದು",               less},
        {">",                    greater},
        {"greater",              greater},
        {"ಹಿರಿದು",               greater},
        {"<=",                   lessOrEqual},
        {"≤",                    lessOrEqual},
        {"ಕಿರಿದುಸಮ",             lessOrEqual},
        {">=",                   greaterOrEqual},
        {"≥",                    greaterOrEqual},
        {"ಹಿರಿದುಸಮ",             greaterOrEqual},
        {"=",                    equal},
        {"equal",                equal},
        {"ಸಮ",                   equal},
        {"!=",                   notEqual},
        {"≠",                    notEqual},
        {"ಸಮನಲ್ಲ",               notEqual},

        {"and",                  logicalAnd},
        {"ಮತ್ತು",                logicalAnd},
        {"or",                   logicalOr},
        {"ಅಥವಾ",                 logicalOr},
        {"not",                  logicalNot},
        {"ಅಲ್ಲ",                 logicalNot},
        {"true",                 pushTrue},
        {"ನಿಜ",                  pushTrue},
        {"ಸರಿ",                  pushTrue},
        {"ಹೌದು",                 pushTrue},
        {"false",                pushFalse},
        {"ಸುಳ್ಳು",               pushFalse},
        {"ತಪ್ಪು",                pushFalse},
        {"ಬೇಸ",                  pushFalse},
        {"ಇಲ್ಲ",                 pushFalse},

        {"dup",                  dup},
        {"ನಕಲು",                 dup},
        {"drop",                 drop},
        {"ಬಿಡು",                 drop},
        {"swap",                 swap},
        {"ಅದಲುಬದಲು",             swap},
        {"over",                 over},
        {"ಮೇಲೆ",                 over},
        {"rot",                  rot},
        {"ತಿರುಗಿಸು",             rot},
        {"depth",                depth},
        {".s",                   dotS},

        {"text-length",          textLength},
        {"concatenate",          concatenate},
        {"concat",               concatenate},
        {",",                    concatenate},
        {"ಜೋಡಿಸು",               concatenate},
        {"character-at",         characterAt},
        {"char-at",              characterAt},

        {"list-new",             listNew},
        {"push-item",            listPush},
        {"append",               listPush},
        {"ಸೇರಿಸು",               listPush},
        {"length",               length},
        {"ಉದ್ದ",                 length},
        {"index",                listIndex},
        {"nth",                  listIndex},
        {"ತೆಗೆ",                 listIndex},
        {"first",                first},
        {"ಮೊದಲ",                 first},
        {"rest",                 rest},
        {"ಉಳಿದ",                 rest},

        {"print",                print},
        {"ಮುದ್ರಿಸು",             print},
        {"println",              println},
        {"read-file",            readFile},
        {"ಓದು",                  readFile},
        {"write-file",           writeFile},
        {"ಬರೆ",                  writeFile},
    };
    return std::vector<Primitive>(std::begin(table), std::end(table));
}

bool doNamesMatch(const char* name1, const std::string& name2) {
    auto length = std::strlen(name1);
    if (length != name2.length())
        return false;
    for (std::size_t i = 0; i < length; ++i) {
        auto c1 = static_cast<unsigned char>(name1[i]);
        auto c2 = static_cast<unsigned char>(name2[i]);
        if (c1 < 0x80 && c2 < 0x80) {
            if (std::toupper(c1) != std::toupper(c2))
                return false;
        }
        else if (c1 != c2) {
            return false;
        }
    }
    return true;
}

} // end anonymous namespace

const std::vector<Primitive>& primitives() {
    static const std::vector<Primitive> table = buildPrimitives();
    return table;
}

const Primitive* findPrimitive(const std::string& name) {
    if (name.empty())
        return nullptr;
    for (auto& p: primitives()) {
        if (doNamesMatch(p.name, name))
            return &p;
    }
    return nullptr;
}

void execute(Session& s, const std::string& name) {
    auto primitive = findPrimitive(name);
    RUNTIME_FAULT_IF(primitive == nullptr, FaultKind::UnknownWord, "unrecognized word: " + name);
    if (s.isTracing())
        std::cerr << "trace: " << name << " " << s.depth() << std::endl;
    primitive->code(s);
}

} // namespace kapila

const char* kapilaVersion = "1.0.0";
