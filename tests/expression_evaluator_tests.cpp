#include "pesadb/common/sql_errors.hpp"
#include "pesadb/executor/expression_evaluator.hpp"
#include "pesadb/parser/parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <utility>
#include <variant>

using pesadb::SqlErrc;
using pesadb::SqlError;
using pesadb::executor::Logic;
using pesadb::storage::Value;
namespace executor = pesadb::executor;
namespace parser = pesadb::parser;

namespace {

class MapResolver final : public executor::ValueResolver {
public:
    explicit MapResolver(std::map<std::string, Value> values)
        : values_{std::move(values)}
    {}

    [[nodiscard]] Value resolve_column(const parser::ColumnReference& reference) const override
    {
        const auto it = values_.find(reference.column);
        if (it == values_.end()) {
            throw SqlError{SqlErrc::ColumnNotFound, "Column '" + reference.column + "' not found"};
        }
        return it->second;
    }

private:
    std::map<std::string, Value> values_;
};

// Parses `SELECT * FROM t WHERE <condition>` and evaluates the condition.
Logic evaluate_where(const std::string& condition, const executor::ValueResolver& resolver)
{
    const auto command = parser::parse_command("SELECT * FROM t WHERE " + condition);
    const auto& select = std::get<parser::SelectCommand>(command);
    REQUIRE(select.where != nullptr);
    return executor::evaluate_predicate(*select.where, resolver);
}

const MapResolver& sample_row()
{
    static const MapResolver resolver{std::map<std::string, Value>{{"age", Value{std::int64_t{30}}},
                                                                   {"score", Value{2.5}},
                                                                   {"name", Value{std::string{"Alice"}}},
                                                                   {"active", Value{true}},
                                                                   {"note", Value{}}}};
    return resolver;
}

}  // namespace

TEST_CASE("comparisons follow SQL semantics", "[evaluator]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("age = 30", row) == Logic::True);
    CHECK(evaluate_where("age <> 30", row) == Logic::False);
    CHECK(evaluate_where("age > 29.5", row) == Logic::True);
    CHECK(evaluate_where("score < 3", row) == Logic::True);
    CHECK(evaluate_where("name >= 'Alice'", row) == Logic::True);
    CHECK(evaluate_where("active = TRUE", row) == Logic::True);
    CHECK(evaluate_where("30 = age", row) == Logic::True);
}

TEST_CASE("comparisons against NULL are unknown", "[evaluator][null]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("note = 1", row) == Logic::Unknown);
    CHECK(evaluate_where("note = NULL", row) == Logic::Unknown);
    CHECK(evaluate_where("age != NULL", row) == Logic::Unknown);
    CHECK(evaluate_where("note IS NULL", row) == Logic::True);
    CHECK(evaluate_where("age IS NOT NULL", row) == Logic::True);
}

TEST_CASE("logical operators use three-valued logic", "[evaluator][null]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("note = 1 AND age = 1", row) == Logic::False);
    CHECK(evaluate_where("note = 1 AND age = 30", row) == Logic::Unknown);
    CHECK(evaluate_where("note = 1 OR age = 30", row) == Logic::True);
    CHECK(evaluate_where("note = 1 OR age = 1", row) == Logic::Unknown);
    CHECK(evaluate_where("NOT note = 1", row) == Logic::Unknown);
    CHECK(evaluate_where("NOT age = 1", row) == Logic::True);
}

TEST_CASE("AND and OR skip the right operand once the left decides", "[evaluator][errors]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("age = 99 AND name > 1", row) == Logic::False);
    CHECK(evaluate_where("age = 30 OR name > 1", row) == Logic::True);
    CHECK(evaluate_where("age = 99 AND missing = 1", row) == Logic::False);

    CHECK_THROWS_AS(evaluate_where("age = 30 AND name > 1", row), SqlError);
    CHECK_THROWS_AS(evaluate_where("age = 99 OR name > 1", row), SqlError);
    CHECK_THROWS_AS(evaluate_where("note = 1 AND name > 1", row), SqlError);
}

TEST_CASE("equality across unrelated kinds is false while ordering them is an error", "[evaluator][errors]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("name = 1", row) == Logic::False);
    CHECK(evaluate_where("name != 1", row) == Logic::True);

    try {
        static_cast<void>(evaluate_where("name < 1", row));
        FAIL("expected a type mismatch");
    } catch (const SqlError& error) {
        CHECK(error.errc() == SqlErrc::TypeMismatch);
        CHECK(error.detail() == "Cannot compare STRING with INT in 'name < 1'");
    }
}

TEST_CASE("BETWEEN, IN and LIKE predicates", "[evaluator]")
{
    const auto& row = sample_row();
    CHECK(evaluate_where("age BETWEEN 18 AND 30", row) == Logic::True);
    CHECK(evaluate_where("age NOT BETWEEN 18 AND 30", row) == Logic::False);
    CHECK(evaluate_where("note BETWEEN 1 AND 2", row) == Logic::Unknown);

    CHECK(evaluate_where("age IN (1, 30, 50)", row) == Logic::True);
    CHECK(evaluate_where("age IN (30.0)", row) == Logic::True);
    CHECK(evaluate_where("age NOT IN (1, 2)", row) == Logic::True);
    CHECK(evaluate_where("note IN (1, NULL)", row) == Logic::Unknown);

    CHECK(evaluate_where("name LIKE 'al%'", row) == Logic::True);
    CHECK(evaluate_where("name LIKE 'A_ice'", row) == Logic::True);
    CHECK(evaluate_where("name NOT LIKE '%z%'", row) == Logic::True);
    CHECK(evaluate_where("note LIKE '%'", row) == Logic::Unknown);
}

TEST_CASE("non-boolean conditions are rejected", "[evaluator][errors]")
{
    const auto& row = sample_row();
    try {
        static_cast<void>(evaluate_where("age", row));
        FAIL("expected a type mismatch");
    } catch (const SqlError& error) {
        CHECK(error.errc() == SqlErrc::TypeMismatch);
    }
    CHECK(evaluate_where("active", row) == Logic::True);
    CHECK(evaluate_where("note", row) == Logic::Unknown);
}

TEST_CASE("aggregates outside grouped evaluation are rejected", "[evaluator][errors]")
{
    const auto& row = sample_row();
    try {
        static_cast<void>(evaluate_where("COUNT(*) > 1", row));
        FAIL("expected an aggregation error");
    } catch (const SqlError& error) {
        CHECK(error.errc() == SqlErrc::AmbiguousAggregation);
    }
}

TEST_CASE("like_match anchors patterns and folds ASCII case", "[evaluator][like]")
{
    CHECK(executor::like_match("hello", "h%o"));
    CHECK(executor::like_match("hello", "%"));
    CHECK(executor::like_match("", "%"));
    CHECK(executor::like_match("HELLO", "hello"));
    CHECK(executor::like_match("abcabc", "%bc"));
    CHECK_FALSE(executor::like_match("hello", "hell"));
    CHECK_FALSE(executor::like_match("hello", "_ello_"));
    CHECK_FALSE(executor::like_match("", "_"));
}

TEST_CASE("logic helpers", "[evaluator]")
{
    CHECK(executor::logic_not(Logic::True) == Logic::False);
    CHECK(executor::logic_not(Logic::Unknown) == Logic::Unknown);
    CHECK(std::string{executor::logic_name(Logic::Unknown)} == "UNKNOWN");
    CHECK(executor::compare(parser::ComparisonOperator::LessOrEqual, Value{std::int64_t{2}}, Value{2.0}) == Logic::True);
}
