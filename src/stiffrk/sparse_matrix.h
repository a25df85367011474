#ifndef STIFFRK_SPARSE_MATRIX_H_
#define STIFFRK_SPARSE_MATRIX_H_

#include <vector>

namespace stiffrk
{

// Compressed column storage pattern. column_sums has num_columns+1 entries
// and row_indexes is sorted within each column.
struct CompressedColumnPattern
{
  int num_rows;
  std::vector<int> column_sums;
  std::vector<int> row_indexes;

  int num_nonzeros() const {return (int)row_indexes.size();}
  // Returns the position of (row, col) or -1 if the entry is not stored.
  int Find(const int row, const int col) const;
};

// Square matrix assembled from (row, col, value) triplets. Triplets with the
// same position are summed when the matrix is converted or applied.
class SparseMatrix
{
 public:
  explicit SparseMatrix(const int num_rows);
  ~SparseMatrix() {};

  int num_rows() const {return num_rows_;}
  int num_entries() const {return (int)values_.size();}

  // Removes all triplets; reserved memory is kept.
  void Reset();
  void Reserve(const int num_entries);

  // Returns 0 on success, 1 if the position is outside the matrix. Out of
  // range positions are remembered and make IsValid() false.
  int Put(const int row, const int col, const double value);

  bool IsValid() const {return num_out_of_range_ == 0;}
  bool AllFinite() const;

  const std::vector<int>& rows() const {return rows_;}
  const std::vector<int>& cols() const {return cols_;}
  const std::vector<double>& values() const {return values_;}

  // y = A*x
  void Multiply(const double x[], double y[]) const;

  // Column major dense copy, dense[col*num_rows + row].
  void ToDense(std::vector<double> *dense) const;

  // Compressed column copy with duplicates summed.
  void ToCompressedColumn(CompressedColumnPattern *pattern,
                          std::vector<double> *values) const;

 private:
  int num_rows_;
  int num_out_of_range_;
  std::vector<int> rows_;
  std::vector<int> cols_;
  std::vector<double> values_;
};

// Builds the union of the stored positions of a set of triplet lists and the
// main diagonal. Each triplet list is mapped onto pattern positions through
// the returned maps (maps[k][j] is the position of triplet j of list k).
void BuildUnionPattern(const int num_rows,
                       const std::vector<const SparseMatrix *> &matrices,
                       CompressedColumnPattern *pattern,
                       std::vector<std::vector<int> > *maps);

} // namespace stiffrk

#endif
