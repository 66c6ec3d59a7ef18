#pragma once
#include "Type.hpp"

namespace gcl {

// --- Primitive Types ---
// "int", "bool" and "String"
class PrimitiveType : public Type {
public:
    std::string name;
    PrimitiveType(std::string n) : name(std::move(n)) {}
    std::string toString() const override { return name; }
    bool equals(const Type& other) const override;
    bool isAssignableTo(const Type& target) const override;
};

// --- Declared function range: function[..N], defined on 0..N ---
class FunctionRangeType : public Type {
public:
    int upper;
    FunctionRangeType(int n) : upper(n) {}
    std::string toString() const override;
    bool equals(const Type& other) const override;
    bool isComparableWith(const Type& other) const override;
    int length() const { return upper + 1; }
};

// --- Comma literal: 1, 2, 3 has length 3 ---
class FunctionLiteralType : public Type {
public:
    int size;
    FunctionLiteralType(int n) : size(n) {}
    std::string toString() const override;
    bool equals(const Type& other) const override;
    bool isAssignableTo(const Type& target) const override;
    bool isComparableWith(const Type& other) const override;
};

// Number of entries of a function-typed value, or -1.
int functionLength(const Type& t);

} // namespace gcl
