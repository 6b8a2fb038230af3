#pragma once

#include <boost/variant.hpp>
#include <boost/variant/recursive_wrapper.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctbind::model
{

/**
 * @brief Position of a declaration in the schema file it came from.
 *
 * Built-in protocol declarations carry an empty file name.
 */
struct SourceLocation {
    std::string file;
    std::size_t line = 0;
    std::size_t column = 0;
};

// ---------- type expressions ----------

enum class ScalarKind { Bool, Unsigned, Signed, Float };

struct Scalar {
    ScalarKind kind = ScalarKind::Unsigned;
    unsigned bits = 0;
};

struct Opaque {
};

struct Void {
};

/// Reference to a declaration by its identity.
struct Named {
    std::string name;
};

struct Array;
struct Pointer;
struct Optional;
struct Slice;

// clang-format off
using Type = boost::variant<
    Scalar,
    Opaque,
    Void,
    Named,
    boost::recursive_wrapper<Array>,
    boost::recursive_wrapper<Pointer>,
    boost::recursive_wrapper<Optional>,
    boost::recursive_wrapper<Slice>
>;
// clang-format on

struct Array {
    Type element;
    std::uint64_t length = 0;
};

struct Pointer {
    Type pointee;
};

/// Nullable wrapper; only meaningful around a pointer.
struct Optional {
    Type child;
};

struct Slice {
    Type element;
};

// ---------- declarations ----------

struct Field {
    std::string name;
    Type type;
    bool reserved = false;  ///< occupies layout space, never exposed as a value
    SourceLocation location;
};

struct Variant {
    std::string name;
    std::uint64_t value = 0;
    SourceLocation location;
};

struct EnumDecl {
    std::string name;
    Type tag;
    std::vector<Variant> variants;
    SourceLocation location;
};

enum class Layout { Auto, Extern, Packed };

struct StructDecl {
    std::string name;
    Layout layout = Layout::Auto;
    std::optional<Type> backing;  ///< declared backing integer of a packed struct
    std::vector<Field> fields;
    SourceLocation location;
};

struct AliasDecl {
    std::string name;
    Type target;
    SourceLocation location;
};

// clang-format off
using Declaration = boost::variant<
    EnumDecl,
    StructDecl,
    AliasDecl
>;
// clang-format on

const std::string& declaration_name(const Declaration& declaration);
const SourceLocation& declaration_location(const Declaration& declaration);

/**
 * @brief The set of native declarations participating in one generation run.
 *
 * Declarations keep their insertion order; identities are unique.
 */
class Schema
{
public:
    /**
     * @brief Add a declaration.
     *
     * @return false if a declaration with the same identity already exists.
     */
    bool add(Declaration declaration);

    const Declaration* find(std::string_view name) const;

    template <typename Decl>
    const Decl* find_as(std::string_view name) const
    {
        const auto* declaration = find(name);
        return declaration ? boost::get<Decl>(declaration) : nullptr;
    }

    const std::vector<Declaration>& declarations() const;

private:
    std::vector<Declaration> declarations_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ---------- construction helpers ----------

Type bool_type();
Type unsigned_type(unsigned bits);
Type signed_type(unsigned bits);
Type float_type(unsigned bits);
Type opaque_type();
Type void_type();
Type named(std::string name);
Type array_of(Type element, std::uint64_t length);
Type pointer_to(Type pointee);
Type optional_of(Type child);
Type slice_of(Type element);

/// Render a type expression in schema syntax, e.g. "array<u8, 16>".
std::string to_string(const Type& type);

bool is_unsigned(const Type& type, unsigned bits);

/**
 * @brief Follow alias declarations until a non-alias type is reached.
 *
 * Unknown names and alias cycles stop the walk; the last type reached is returned.
 */
const Type& resolve_aliases(const Schema& schema, const Type& type);

/**
 * @brief Width in bits of a type as it is laid out inside a packed struct.
 *
 * @return nullopt if the type has no fixed bit width (pointers, extern structs, ...).
 */
std::optional<std::uint64_t> bit_size(const Schema& schema, const Type& type);

}  // namespace ctbind::model
