#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <RecordForge/generator.hpp>
#include <RecordForge/overrides.hpp>

#include "../test_model.hpp"
#include "../test_helpers.hpp"

using namespace RecordForge;
using namespace TestModel;
using TestHelpers::Check;
using TestHelpers::CheckEq;
using TestHelpers::RequireOk;
using TestHelpers::DeepEqual;
using TestHelpers::MergeFailsWith;


void merge_replaces_named_fields() {
    GenerationContext ctx;
    auto generated = Generate<Person>(ctx);
    RequireOk(generated);
    const Person original = generated.value();

    auto merged = Merge(original, {{"name", "Grace"}, {"age", 36}});
    RequireOk(merged);
    CheckEq(merged->name, std::string("Grace"));
    CheckEq(merged->age, 36);
    CheckEq(merged->email, original.email);

    // the input is never touched
    Check(DeepEqual(original, generated.value()));
    CheckEq(original.name, std::string("arbitrary-1"));
}

void empty_overrides_copy() {
    GenerationContext ctx;
    auto generated = Generate<Customer>(ctx);
    RequireOk(generated);
    auto merged = Merge(generated.value(), Overrides{});
    RequireOk(merged);
    Check(DeepEqual(merged.value(), generated.value()));
}

void generate_with_overrides() {
    GenerationContext ctx;
    auto person = Generate<Person>({{"email", "fixed@example.com"}}, ctx);
    RequireOk(person);
    CheckEq(person->email, std::string("fixed@example.com"));
    CheckEq(person->name, std::string("arbitrary-1"));
    CheckEq(person->age, 2);

    Overrides ov;
    ov.set("status", Status::Closed).set("address.city", "Paris");
    CheckEq(ov.size(), std::size_t(2));
    Check(ov.contains("address.city"));

    auto customer = Generate<Customer>(ov, ctx);
    RequireOk(customer);
    Check(customer->status == Status::Closed);
    CheckEq(customer->address.city, std::string("Paris"));
    Check(TestHelpers::HasSequenceForm(customer->address.street, "arbitrary"));
}

void dotted_paths() {
    GenerationContext ctx;
    auto order = Generate<Order>(ctx);
    RequireOk(order);

    auto merged = Merge(order.value(), {
        {"customer.address.zip", std::optional<std::string>("12345")},
        {"customer.name", "Ada"},
        {"shipped", true}
    });
    RequireOk(merged);
    CheckEq(merged->customer.address.zip.value(), std::string("12345"));
    CheckEq(merged->customer.name, std::string("Ada"));
    CheckEq(merged->customer.address.street, order->customer.address.street);
    Check(merged->shipped);
    CheckEq(merged->id, order->id);
    Check(DeepEqual(merged->lines, order->lines));
}

void whole_record_then_nested() {
    GenerationContext ctx;
    auto customer = Generate<Customer>(ctx);
    RequireOk(customer);

    auto merged = Merge(customer.value(), {
        {"address.city", "Lyon"},
        {"address", Address{"1 Rue Haute", "Paris", std::nullopt}}
    });
    RequireOk(merged);
    CheckEq(merged->address.street, std::string("1 Rue Haute"));
    CheckEq(merged->address.city, std::string("Lyon"));
    Check(!merged->address.zip.has_value());
}

void annotated_and_described_fields() {
    GenerationContext ctx;
    auto annotations = Generate<Annotations>(ctx);
    RequireOk(annotations);

    // keys are the annotated names; values may be given bare or wrapped
    auto merged = Merge(annotations.value(), {
        {"display_name", "Neo"},
        {"years", Annotated<int, options::key<"years">>(42)}
    });
    RequireOk(merged);
    CheckEq(merged->name.get(), std::string("Neo"));
    CheckEq(merged->age.get(), 42);
    CheckEq(merged->contact.get(), annotations->contact.get());

    Check(MergeFailsWith(annotations.value(), {{"name", "Neo"}},
                         GenerateError::UNKNOWN_FIELD, "Annotations.name"));

    auto account = Generate<Account>(ctx);
    RequireOk(account);
    auto rebuilt = Merge(account.value(), {{"billing", "billing@corp.example"}});
    RequireOk(rebuilt);
    CheckEq(rebuilt->billingEmail(), std::string("billing@corp.example"));
    CheckEq(rebuilt->owner(), account->owner());
    CheckEq(rebuilt->number(), account->number());
}

void unknown_fields() {
    GenerationContext ctx;
    auto customer = Generate<Customer>(ctx);
    RequireOk(customer);

    Check(MergeFailsWith(customer.value(), {{"nickname", "x"}},
                         GenerateError::UNKNOWN_FIELD, "Customer.nickname"));
    Check(MergeFailsWith(customer.value(), {{"address.planet", "Mars"}},
                         GenerateError::UNKNOWN_FIELD, "Customer.address.planet"));
    Check(MergeFailsWith(customer.value(), {{"name.first", "Ada"}},
                         GenerateError::UNKNOWN_FIELD, "Customer.name.first"));
    Check(MergeFailsWith(customer.value(), {{"", "x"}},
                         GenerateError::UNKNOWN_FIELD, "Customer."));
    // a trailing dot names an empty field below the head
    Check(MergeFailsWith(customer.value(), {{"address.", Address{}}},
                         GenerateError::UNKNOWN_FIELD, "Customer.address."));
    Check(MergeFailsWith(customer.value(), {{"name.", "Ada"}},
                         GenerateError::UNKNOWN_FIELD, "Customer.name."));

    auto trailing = Generate<Customer>({{"address.", Address{}}}, ctx);
    Check(!trailing);
    Check(trailing.error() == GenerateError::UNKNOWN_FIELD);
    CheckEq(trailing.errorPathString(), std::string_view("Customer.address."));

    // keys are checked before anything is generated
    std::int64_t before = ctx.counter().last();
    auto rejected = Generate<Customer>({{"nickname", "x"}}, ctx);
    Check(!rejected);
    Check(rejected.error() == GenerateError::UNKNOWN_FIELD);
    CheckEq(ctx.counter().last(), before);
}

void type_mismatches() {
    GenerationContext ctx;
    auto person = Generate<Person>(ctx);
    RequireOk(person);

    Check(MergeFailsWith(person.value(), {{"age", "36"}},
                         GenerateError::TYPE_MISMATCH, "Person.age"));
    Check(MergeFailsWith(person.value(), {{"age", 36L}},
                         GenerateError::TYPE_MISMATCH, "Person.age"));
    Check(MergeFailsWith(person.value(), {{"name", 5}},
                         GenerateError::TYPE_MISMATCH, "Person.name"));
    Check(MergeFailsWith(person.value(), {{"name", std::string_view("Ada")}},
                         GenerateError::TYPE_MISMATCH, "Person.name"));

    auto merged = Merge(person.value(), {{"age", 36L}});
    CheckEq(merged.fieldTypeName(), std::string_view("int"));

    // same check when the overrides come with generation
    auto generated = Generate<Person>({{"age", "x"}}, ctx);
    Check(!generated);
    Check(generated.error() == GenerateError::TYPE_MISMATCH);
    CheckEq(generated.errorPathString(), std::string_view("Person.age"));

    GenerationContext other;
    auto customer = Generate<Customer>(other);
    RequireOk(customer);
    // optional fields take the optional type, not the contained one
    Check(MergeFailsWith(customer.value(), {{"address.zip", "12345"}},
                         GenerateError::TYPE_MISMATCH, "Customer.address.zip"));
    Check(MergeFailsWith(customer.value(), {{"address", Person{}}},
                         GenerateError::TYPE_MISMATCH, "Customer.address"));
    Check(MergeFailsWith(customer.value(), {{"status", 2}},
                         GenerateError::TYPE_MISMATCH, "Customer.status"));
}

int main() {
    merge_replaces_named_fields();
    empty_overrides_copy();
    generate_with_overrides();
    dotted_paths();
    whole_record_then_nested();
    annotated_and_described_fields();
    unknown_fields();
    type_mismatches();

    std::cout << "override tests passed\n";
    return 0;
}
