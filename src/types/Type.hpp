#pragma once
#include <string>
#include <memory>

namespace gcl {

class Type;
using TypePtr = std::shared_ptr<Type>;

class Type {
public:
    virtual ~Type() = default;
    virtual std::string toString() const = 0;

    // Equality (Strict)
    virtual bool equals(const Type& other) const = 0;

    // Can a value of this type be stored in a variable declared as `target`?
    virtual bool isAssignableTo(const Type& target) const;

    // May `==` / `<>` compare a value of this type with one of `other`?
    virtual bool isComparableWith(const Type& other) const;

    template <typename T>
    const T* as() const { return dynamic_cast<const T*>(this); }
};

bool typesEqual(const TypePtr& a, const TypePtr& b);

// Shared instances of the primitive types.
TypePtr intType();
TypePtr boolType();
TypePtr stringType();

bool isInt(const TypePtr& t);
bool isBool(const TypePtr& t);
bool isString(const TypePtr& t);
bool isFunction(const TypePtr& t);

} // namespace gcl
