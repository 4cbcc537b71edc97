#include "dataframe.hpp"

#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>

#include <arrow/api.h>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace tabula;

namespace {

auto sample() -> Table {
    return Table({"id", "mz", "ok", "name", "raw"},
                 {Type::integer(), Type::floating(), Type::boolean(), Type::string(),
                  Type::blob()},
                 {"%d", "%.5f", "%s", "%s", "%r"},
                 {{1, 100.5, true, "a", Blob::make("xy")},
                  {2, Value(), false, Value(), Value()},
                  {3, std::nan(""), Value(), "c", Blob::make("z")}},
                 "sample");
}

}  // namespace

TEST_CASE("to_arrow maps column types", "[arrow]") {
    auto arrow_table = dataframe::to_arrow(sample());
    REQUIRE(arrow_table->num_rows() == 3);
    REQUIRE(arrow_table->num_columns() == 5);

    const auto& schema = *arrow_table->schema();
    REQUIRE(schema.field(0)->type()->id() == arrow::Type::INT64);
    REQUIRE(schema.field(1)->type()->id() == arrow::Type::DOUBLE);
    REQUIRE(schema.field(2)->type()->id() == arrow::Type::BOOL);
    REQUIRE(schema.field(3)->type()->id() == arrow::Type::STRING);
    REQUIRE(schema.field(4)->type()->id() == arrow::Type::BINARY);
    REQUIRE(schema.field(1)->name() == "mz");

    REQUIRE(arrow_table->column(1)->null_count() == 2);
    REQUIRE(arrow_table->column(3)->null_count() == 1);
}

TEST_CASE("to_arrow infers untyped columns", "[arrow]") {
    auto t = Table({"v", "missing"}, {Type::any(), Type::any()}, {"%r", "%r"},
                   {{1, Value()}, {2, Value()}});
    auto arrow_table = dataframe::to_arrow(t);
    REQUIRE(arrow_table->schema()->field(0)->type()->id() == arrow::Type::INT64);
    REQUIRE(arrow_table->schema()->field(1)->type()->id() == arrow::Type::NA);
}

TEST_CASE("to_arrow rejects nested tables", "[arrow]") {
    auto inner = std::make_shared<const Table>(sample());
    auto t = Table({"sub"}, {Type::table()}, {"%s"}, {{inner}});
    REQUIRE_THROWS_AS(dataframe::to_arrow(t), TypeError);
}

TEST_CASE("from_arrow restores a table", "[arrow]") {
    auto arrow_table = dataframe::to_arrow(sample());
    auto t = dataframe::from_arrow(*arrow_table, dataframe::FromArrowOptions{.title = "back"});

    REQUIRE(t.title() == "back");
    REQUIRE(t.column_names() == sample().column_names());
    REQUIRE(t.column_types() == sample().column_types());
    REQUIRE(t.col_format("id") == "%d");
    REQUIRE(t.col_format("mz") == "%f");
    REQUIRE(t.col_format("name") == "%s");

    REQUIRE(t.get_value(0, "mz").as_float() == Catch::Approx(100.5));
    REQUIRE(t.get_value(2, "mz").is_none());
    REQUIRE(t.get_value(1, "name").is_none());
    REQUIRE(t.get_value(0, "ok") == Value(true));
    auto blob = std::dynamic_pointer_cast<const Blob>(t.get_value(0, "raw").as_object());
    REQUIRE(blob != nullptr);
    REQUIRE(blob->data() == "xy");
}

TEST_CASE("from_arrow options", "[arrow]") {
    arrow::Int32Builder ints;
    REQUIRE(ints.AppendValues(std::vector<std::int32_t>{1, 2, 3}).ok());
    std::shared_ptr<arrow::Array> int_array;
    REQUIRE(ints.Finish(&int_array).ok());

    arrow::FloatBuilder floats;
    REQUIRE(floats.AppendValues(std::vector<float>{0.5F, 1.5F, 2.5F}).ok());
    std::shared_ptr<arrow::Array> float_array;
    REQUIRE(floats.Finish(&float_array).ok());

    arrow::FieldVector fields{arrow::field("n", arrow::int32()), arrow::field("x", arrow::float32())};
    std::vector<std::shared_ptr<arrow::Array>> arrays{int_array, float_array};
    auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

    SECTION("narrow arrow types widen") {
        auto t = dataframe::from_arrow(*arrow_table);
        REQUIRE(t.col_type("n") == Type::integer());
        REQUIRE(t.col_type("x") == Type::floating());
        REQUIRE(t.get_value(2, "x").as_float() == Catch::Approx(2.5));
    }

    SECTION("type and format overrides") {
        dataframe::FromArrowOptions options;
        options.types["n"] = Type::floating();
        options.formats["n"] = "%.1f";
        options.type_formats[TypeKind::Float] = "%.3f";
        auto t = dataframe::from_arrow(*arrow_table, options);
        REQUIRE(t.col_type("n") == Type::floating());
        REQUIRE(t.get_value(0, "n").is_float());
        REQUIRE(t.col_format("n") == "%.1f");
        REQUIRE(t.col_format("x") == "%.3f");
    }
}
