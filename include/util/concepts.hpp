// Collection of concepts and other useful templates.
#pragma once

struct TrueType { static constexpr bool value = true; };
struct FalseType { static constexpr bool value = false; };

template<typename U, typename V>
struct _SameAs : FalseType {};

template<typename U>
struct _SameAs<U, U> : TrueType {};

// Evaluates to true if U and V are the same type, false otherwise.
template<typename U, typename V>
inline constexpr bool SameAs = _SameAs<U, V>::value;

// Strip the reference and cv-qualifiers from a type.
template<typename T> struct _RemoveCvRef { using Type = T; };
template<typename T> struct _RemoveCvRef<T&> : _RemoveCvRef<T> {};
template<typename T> struct _RemoveCvRef<T&&> : _RemoveCvRef<T> {};
template<typename T> struct _RemoveCvRef<T const> : _RemoveCvRef<T> {};
template<typename T> struct _RemoveCvRef<T volatile> : _RemoveCvRef<T> {};
template<typename T> struct _RemoveCvRef<T const volatile> : _RemoveCvRef<T> {};

template<typename T>
using RemoveCvRef = typename _RemoveCvRef<T>::Type;

// Concepts used to check how the address and attribute types can be combined.
template<typename U, typename V>
concept Constructible = requires(V const& v) { U(v); };
template<typename U, typename V>
concept ComparableEq = requires(U u, V v) { u == v; };
template<typename U, typename V>
concept ComparableLt = requires(U u, V v) { u < v; };
template<typename U, typename V>
concept Subtractable = requires(U u, V v) { u - v; };
