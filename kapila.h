#ifndef kapila_h_included
#define kapila_h_included

#include "kapilaconfig.h"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#ifndef KAPILA_STACK_COUNT
#define KAPILA_STACK_COUNT (1024)
#endif

#ifndef KAPILA_LIST_INITIAL_CAPACITY
#define KAPILA_LIST_INITIAL_CAPACITY (8)
#endif

#ifndef KAPILA_ALLOCATION_LIMIT
#define KAPILA_ALLOCATION_LIMIT (0)
#endif

extern const char* kapilaVersion;

namespace kapila {

enum class FaultKind {
    StackUnderflow,
    StackOverflow,
    OutOfMemory,
    TypeMismatch,
    DivideByZero,
    BadOperand,
    IndexOutOfRange,
    FileError,
    UnknownWord
};

const char* faultKindName(FaultKind kind);

// Thrown by every checked operation.  The session stays usable afterwards.
class RuntimeFault: public std::runtime_error {
public:
    RuntimeFault(FaultKind kind, const std::string& msg): std::runtime_error(msg), kind_(kind) {}
    RuntimeFault(FaultKind kind, const char* msg): std::runtime_error(msg), kind_(kind) {}

    FaultKind kind() const { return kind_; }

private:
    FaultKind kind_;
};

enum class ValueType {
    Integer,
    Float,
    Boolean,
    Text,
    List
};

const char* typeName(ValueType type);

struct List;

// Text payload.  `bytes` is not necessarily null-terminated for borrowed
// text; owned text always has a terminator at bytes[length].
struct Text {
    const char* bytes;
    std::size_t length;
    bool        owned;
};

class Value {
public:
    Value(): type_(ValueType::Integer) { integer_ = 0; }

    static Value makeInteger(std::int64_t n);
    static Value makeFloat(double x);
    static Value makeBoolean(bool b);
    static Value makeText(const char* bytes, std::size_t length, bool owned);
    static Value makeList(List* list);

    ValueType type() const { return type_; }

    bool isInteger() const { return type_ == ValueType::Integer; }
    bool isFloat() const   { return type_ == ValueType::Float; }
    bool isBoolean() const { return type_ == ValueType::Boolean; }
    bool isText() const    { return type_ == ValueType::Text; }
    bool isList() const    { return type_ == ValueType::List; }
    bool isNumeric() const { return isInteger() || isFloat(); }

    std::int64_t asInteger() const;
    double asFloat() const;
    bool asBoolean() const;
    const Text& asText() const;
    List* asList() const;

    // Integer or Float, promoted to double.
    double toNumber() const;

    // Copy of the text bytes.  Throws TypeMismatch for non-text values.
    std::string textString() const;

private:
    ValueType type_;
    union {
        std::int64_t integer_;
        double       float_;
        bool         boolean_;
        Text         text_;
        List*        list_;
    };
};

// The list header and its item array both live in tracker-owned memory, so
// every Value holding the same List* sees the same items.
struct List {
    Value*      items;
    std::size_t length;
    std::size_t capacity;
};

class AllocationTracker {
public:
    explicit AllocationTracker(std::size_t limit = KAPILA_ALLOCATION_LIMIT): limit_(limit) {}

    AllocationTracker(const AllocationTracker&) = delete;
    AllocationTracker& operator=(const AllocationTracker&) = delete;

    void* allocate(std::size_t size);

    template<typename T>
    T* allocate(std::size_t count) {
        static_assert(std::is_trivially_destructible<T>::value,
                      "tracked objects are never destroyed individually");
        auto p = static_cast<T*>(allocate(sizeof(T) * count));
        for (std::size_t i = 0; i < count; ++i)
            new (p + i) T();
        return p;
    }

    Value duplicateText(const char* bytes, std::size_t length);

    void releaseAll();

    std::size_t allocationCount() const { return buffers.size(); }
    std::size_t bytesAllocated() const { return bytes; }

    std::size_t limit() const { return limit_; }
    void setLimit(std::size_t limit) { limit_ = limit; }

private:
    std::vector<std::unique_ptr<unsigned char[]>> buffers;
    std::size_t bytes = 0;
    std::size_t limit_;
};

class OperandStack {
public:
    explicit OperandStack(std::size_t capacity = KAPILA_STACK_COUNT);

    void push(const Value& v);
    Value pop();
    Value peek() const;

    // Element `n` places below the top; at(0) is the top.
    Value& at(std::size_t n);
    const Value& at(std::size_t n) const;

    std::size_t depth() const { return cells.size(); }
    std::size_t capacity() const { return capacity_; }
    void clear() { cells.clear(); }

private:
    std::vector<Value> cells;
    std::size_t capacity_;
};

enum class FailureMode {
    Lenient,    // bad operands produce benign defaults
    Strict      // bad operands raise RuntimeFault
};

class Session {
public:
    explicit Session(std::ostream& out = std::cout,
                     std::size_t stackCapacity = KAPILA_STACK_COUNT);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void init();
    void finalize();

    OperandStack& stack() { return stack_; }
    const OperandStack& stack() const { return stack_; }
    AllocationTracker& tracker() { return tracker_; }
    const AllocationTracker& tracker() const { return tracker_; }
    std::ostream& output() { return *out; }

    FailureMode failureMode() const { return mode; }
    void setFailureMode(FailureMode m) { mode = m; }

    bool isTracing() const { return tracing; }
    void setTrace(bool on) { tracing = on; }

    void pushInteger(std::int64_t n);
    void pushFloat(double x);
    void pushBoolean(bool b);
    void pushText(const char* s);
    void pushText(const char* bytes, std::size_t length);
    void pushOwnedText(const std::string& s);
    void pushList(List* list);
    void pushValue(const Value& v);

    Value pop();
    Value peek() const;
    std::size_t depth() const { return stack_.depth(); }

    List* newList();
    void appendItem(List* list, const Value& v);

private:
    OperandStack      stack_;
    AllocationTracker tracker_;
    std::ostream*     out;
    FailureMode       mode = FailureMode::Lenient;
    bool              tracing = false;
};

// Primitive operations.  Each one consumes its operands from the session
// stack and pushes its results there.

using Code = void(*)(Session&);

// Arithmetic
void add(Session& s);
void subtract(Session& s);
void multiply(Session& s);
void divide(Session& s);
void modulo(Session& s);

// Comparison
void less(Session& s);
void greater(Session& s);
void lessOrEqual(Session& s);
void greaterOrEqual(Session& s);
void equal(Session& s);
void notEqual(Session& s);

// Logic
void logicalAnd(Session& s);
void logicalOr(Session& s);
void logicalNot(Session& s);

// Stack manipulation
void dup(Session& s);
void drop(Session& s);
void swap(Session& s);
void over(Session& s);
void rot(Session& s);
void depth(Session& s);
void dotS(Session& s);
void pushTrue(Session& s);
void pushFalse(Session& s);

// Text
void textLength(Session& s);
void concatenate(Session& s);
void characterAt(Session& s);

// List
void listNew(Session& s);
void listPush(Session& s);
void length(Session& s);
void listIndex(Session& s);
void first(Session& s);
void rest(Session& s);

// I/O
void print(Session& s);
void println(Session& s);
void readFile(Session& s);
void writeFile(Session& s);

// Number of scalar values in a UTF-8 byte sequence.
std::size_t utf8Length(const char* bytes, std::size_t length);

struct Primitive {
    const char* name;
    Code        code;
};

const std::vector<Primitive>& primitives();
const Primitive* findPrimitive(const std::string& name);
void execute(Session& s, const std::string& name);

} // namespace kapila

#endif // kapila_h_included
