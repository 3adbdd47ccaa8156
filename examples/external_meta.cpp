#include <RecordForge/generator.hpp>
#include <RecordForge/descriptor.hpp>
using RecordForge::Annotated;
using RecordForge::options::key, RecordForge::options::email, RecordForge::options::string_prefix;
#include <iostream>
#include <format>
#include <string>
using std::cout;
using std::endl;
using std::format;


enum class Role { Guest, Member, Admin };

template<> struct RecordForge::EnumMeta<Role> {
    using Variants = EnumVariants<Role::Member, Role::Guest, Role::Admin>;
};

struct Vec {
    float x, y, z;
};

// options for a field of a type you cannot touch
template<> struct RecordForge::AnnotatedField<Vec, 1> {
    using Options = OptionsPack<
        key<"height">
        >;
};

// a class with a constructor, described from outside
class User {
public:
    User(std::string login, std::string contact, Role role):
        login_(std::move(login)), contact_(std::move(contact)), role_(role) {}

    std::string login_;
    std::string contact_;
    Role role_;
};

template<> struct RecordForge::StructMeta<User> {
    static constexpr std::string_view Name = "User";
    using Fields = StructFields<
        Field<&User::login_, "login", string_prefix<"user">>,
        Field<&User::contact_, "contact", email>,
        Field<&User::role_, "role">
    >;
};

struct TopLevel {
    Annotated<std::string, key<"title">> caption;
    Vec position;
    User owner;
};


int main() {
    auto t = RecordForge::Generate<TopLevel>();
    if (!t) {
        cout << RecordForge::GenerateResultToString(t) << endl;
        return 1;
    }
    cout << format("caption: {}, position: ({}, {}, {})", t->caption.get(), t->position.x, t->position.y, t->position.z) << endl;
    /* caption: arbitrary-1, position: (2, 3, 4) */
    cout << format("owner: {} <{}>, role {}", t->owner.login_, t->owner.contact_, static_cast<int>(t->owner.role_)) << endl;
    /* owner: user-5 <random-6@example.com>, role 1 */

    const RecordForge::RecordDescriptor & d = RecordForge::Describe<TopLevel>();
    for (const auto & f : d.fields) {
        cout << format("{}: {} ({})", f.name, f.type_name, RecordForge::kind_to_string(f.kind)) << endl;
    }
    /* title: ..., position: Vec (record), owner: User (record) */
}
