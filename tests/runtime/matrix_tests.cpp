#include <string>

#include "runtime/matrix_ops.h"
#include "test_util.h"

namespace test {

namespace {

bool ShapeErrorFrom(const std::string& source) {
  auto got = RuntimeErrorOf(source);
  return got.has_value() && *got == rt::RuntimeErrorKind::kShape;
}

}  // namespace

void RunMatrixTests(TestContext* ctx) {
  auto env = std::make_shared<rt::Environment>();

  auto m = EvalExpr("[[1, 2], [3, 4]]", env);
  ExpectTrue(m.IsMatrix() && m.matrix.rows == 2 && m.matrix.cols == 2, "matrix_literal_2x2",
             ctx);
  ExpectNear(m.matrix.at(1, 0), 3.0, "matrix_literal_row_major", ctx);
  ExpectTrue(m.ToString() == "[[1, 2], [3, 4]]", "matrix_rendering", ctx);

  auto list = EvalExpr("[1, 2, 3]", env);
  ExpectTrue(list.IsList() && list.list.size() == 3, "flat_list_literal", ctx);
  auto mixed_kinds = EvalExpr("[1, \"a\", transpose([[2]])]", env);
  ExpectTrue(mixed_kinds.IsList() && mixed_kinds.list[2].IsMatrix(), "list_holds_any_value",
             ctx);
  auto column = EvalExpr("[[1], [2], [3]]", env);
  ExpectTrue(column.IsMatrix() && column.matrix.rows == 3 && column.matrix.cols == 1,
             "column_matrix", ctx);

  auto nested_empty = EvalExpr("[[]]", env);
  ExpectTrue(nested_empty.IsList() && nested_empty.list.size() == 1 &&
                 nested_empty.list[0].IsList() && nested_empty.list[0].list.empty(),
             "empty_row_makes_list_of_empty_list", ctx);
  auto empty_then_number = EvalExpr("[[], 1]", env);
  ExpectTrue(empty_then_number.IsList() && empty_then_number.list.size() == 2 &&
                 empty_then_number.list[1].IsNumber(),
             "empty_row_with_bare_element", ctx);
  ExpectTrue(ShapeErrorFrom("y = [[1], []];"), "empty_row_mixed_with_matrix_row", ctx);
  ExpectTrue(ShapeErrorFrom("m = [[1, 2], 3];"), "mixed_rows_shape_error", ctx);
  ExpectTrue(ShapeErrorFrom("m = [[1, 2], [3]];"), "ragged_rows_shape_error", ctx);
  {
    auto got = RuntimeErrorOf("m = [[1, \"a\"]];");
    ExpectTrue(got.has_value() && *got == rt::RuntimeErrorKind::kTypeMismatch,
               "non_numeric_matrix_element", ctx);
  }

  auto t = EvalExpr("transpose([[1, 2, 3], [4, 5, 6]])", env);
  ExpectTrue(t.IsMatrix() && t.matrix.rows == 3 && t.matrix.cols == 2, "transpose_shape", ctx);
  ExpectNear(t.matrix.at(2, 1), 6.0, "transpose_value", ctx);
  auto tt = EvalExpr("transpose(transpose([[1, 2, 3], [4, 5, 6]]))", env);
  ExpectTrue(rt::ValuesEqual(tt, EvalExpr("[[1, 2, 3], [4, 5, 6]]", env)),
             "transpose_round_trip", ctx);

  auto prod = EvalExpr("matmult([[1, 2], [3, 4]], [[5, 6], [7, 8]])", env);
  ExpectTrue(rt::ValuesEqual(prod, EvalExpr("[[19, 22], [43, 50]]", env)), "matmult_values",
             ctx);
  auto rect = EvalExpr("matmult([[1, 2, 3]], [[1], [2], [3]])", env);
  ExpectTrue(rect.IsMatrix() && rect.matrix.rows == 1 && rect.matrix.cols == 1, "matmult_shape",
             ctx);
  ExpectNear(rect.matrix.at(0, 0), 14.0, "matmult_dot", ctx);

  auto sum = EvalExpr("matadd([[1, 2], [3, 4]], [[10, 20], [30, 40]])", env);
  ExpectTrue(rt::ValuesEqual(sum, EvalExpr("[[11, 22], [33, 44]]", env)), "matadd_values", ctx);
  auto diff = EvalExpr("matsub([[5, 5], [5, 5]], [[1, 2], [3, 4]])", env);
  ExpectTrue(rt::ValuesEqual(diff, EvalExpr("[[4, 3], [2, 1]]", env)), "matsub_values", ctx);

  auto inv = EvalExpr("inverse([[4, 7], [2, 6]])", env);
  ExpectTrue(inv.IsMatrix() && inv.matrix.rows == 2, "inverse_shape", ctx);
  ExpectNear(inv.matrix.at(0, 0), 0.6, "inverse_00", ctx);
  ExpectNear(inv.matrix.at(0, 1), -0.7, "inverse_01", ctx);
  ExpectNear(inv.matrix.at(1, 0), -0.2, "inverse_10", ctx);
  ExpectNear(inv.matrix.at(1, 1), 0.4, "inverse_11", ctx);
  auto identity = EvalExpr("matmult([[0, 1], [1, 0]], inverse([[0, 1], [1, 0]]))", env);
  ExpectNear(identity.matrix.at(0, 0), 1.0, "inverse_needs_pivoting_00", ctx);
  ExpectNear(identity.matrix.at(0, 1), 0.0, "inverse_needs_pivoting_01", ctx);

  ExpectTrue(ShapeErrorFrom("m = matadd([[1, 2], [3, 4]], [[1, 2, 3], [4, 5, 6]]);"),
             "matadd_shape_mismatch", ctx);
  ExpectTrue(ShapeErrorFrom("m = matsub([[1]], [[1, 2]]);"), "matsub_shape_mismatch", ctx);
  ExpectTrue(ShapeErrorFrom("m = matmult([[1, 2]], [[1, 2]]);"), "matmult_inner_mismatch", ctx);
  ExpectTrue(ShapeErrorFrom("m = inverse([[1, 2], [2, 4]]);"), "inverse_singular", ctx);
  ExpectTrue(ShapeErrorFrom("m = inverse([[1, 2, 3]]);"), "inverse_non_square", ctx);
  {
    auto got = RuntimeErrorOf("m = transpose([1, 2]);");
    ExpectTrue(got.has_value() && *got == rt::RuntimeErrorKind::kTypeMismatch,
               "transpose_of_list", ctx);
    got = RuntimeErrorOf("m = matadd([[1]], 1);");
    ExpectTrue(got.has_value() && *got == rt::RuntimeErrorKind::kTypeMismatch,
               "matadd_with_number", ctx);
  }

  bool message_has_shapes = false;
  try {
    rt::Matrix a(2, 2);
    rt::Matrix b(3, 3);
    rt::MatAdd(a, b, 1, 1);
  } catch (const rt::RuntimeError& err) {
    message_has_shapes = std::string(err.what()).find("2x2 vs 3x3") != std::string::npos;
  }
  ExpectTrue(message_has_shapes, "shape_error_names_shapes", ctx);
}

}  // namespace test
