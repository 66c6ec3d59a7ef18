#include "TypeImpl.hpp"

namespace gcl {

// --- Helper ---
bool typesEqual(const TypePtr& a, const TypePtr& b) {
    if (!a && !b) return true;
    if (!a || !b) return false;
    return a->equals(*b);
}

TypePtr intType() {
    static TypePtr t = std::make_shared<PrimitiveType>("int");
    return t;
}

TypePtr boolType() {
    static TypePtr t = std::make_shared<PrimitiveType>("bool");
    return t;
}

TypePtr stringType() {
    static TypePtr t = std::make_shared<PrimitiveType>("String");
    return t;
}

bool isInt(const TypePtr& t) { return t && t->equals(*intType()); }
bool isBool(const TypePtr& t) { return t && t->equals(*boolType()); }
bool isString(const TypePtr& t) { return t && t->equals(*stringType()); }

bool isFunction(const TypePtr& t) {
    return t && (t->as<FunctionRangeType>() || t->as<FunctionLiteralType>());
}

int functionLength(const Type& t) {
    if (auto* r = t.as<FunctionRangeType>()) return r->length();
    if (auto* l = t.as<FunctionLiteralType>()) return l->size;
    return -1;
}

// --- Base Type ---
bool Type::isAssignableTo(const Type& target) const {
    return this->equals(target);
}

bool Type::isComparableWith(const Type& other) const {
    return this->equals(other);
}

// --- PrimitiveType ---
bool PrimitiveType::equals(const Type& other) const {
    if (auto* o = other.as<PrimitiveType>()) return name == o->name;
    return false;
}

bool PrimitiveType::isAssignableTo(const Type& target) const {
    if (Type::isAssignableTo(target)) return true;
    // A single int fills a function[..0]
    if (name == "int") {
        if (auto* r = target.as<FunctionRangeType>()) return r->upper == 0;
    }
    return false;
}

// --- FunctionRangeType ---
std::string FunctionRangeType::toString() const {
    return "function[.." + std::to_string(upper) + "]";
}

bool FunctionRangeType::equals(const Type& other) const {
    if (auto* o = other.as<FunctionRangeType>()) return upper == o->upper;
    return false;
}

bool FunctionRangeType::isComparableWith(const Type& other) const {
    return functionLength(other) == length();
}

// --- FunctionLiteralType ---
std::string FunctionLiteralType::toString() const {
    return "function with length=" + std::to_string(size);
}

bool FunctionLiteralType::equals(const Type& other) const {
    if (auto* o = other.as<FunctionLiteralType>()) return size == o->size;
    return false;
}

bool FunctionLiteralType::isAssignableTo(const Type& target) const {
    if (auto* r = target.as<FunctionRangeType>()) return r->length() == size;
    return Type::isAssignableTo(target);
}

bool FunctionLiteralType::isComparableWith(const Type& other) const {
    return functionLength(other) == size;
}

} // namespace gcl
