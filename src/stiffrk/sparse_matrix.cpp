#include <math.h>

#include <cmath>

#include <algorithm>
#include <utility>

#include "sparse_matrix.h"

namespace stiffrk
{

int CompressedColumnPattern::Find(const int row, const int col) const
{
  if(col < 0 || col+1 >= (int)column_sums.size()) {
    return -1;
  }
  std::vector<int>::const_iterator begin =
    row_indexes.begin() + column_sums[col];
  std::vector<int>::const_iterator end =
    row_indexes.begin() + column_sums[col+1];
  std::vector<int>::const_iterator it = std::lower_bound(begin, end, row);
  if(it == end || *it != row) {
    return -1;
  }
  return (int)(it - row_indexes.begin());
}

SparseMatrix::SparseMatrix(const int num_rows)
  : num_rows_(num_rows),
    num_out_of_range_(0)
{
}

void SparseMatrix::Reset()
{
  rows_.clear();
  cols_.clear();
  values_.clear();
  num_out_of_range_ = 0;
}

void SparseMatrix::Reserve(const int num_entries)
{
  rows_.reserve(num_entries);
  cols_.reserve(num_entries);
  values_.reserve(num_entries);
}

int SparseMatrix::Put(const int row, const int col, const double value)
{
  if(row < 0 || row >= num_rows_ || col < 0 || col >= num_rows_) {
    ++num_out_of_range_;
    return 1;
  }
  rows_.push_back(row);
  cols_.push_back(col);
  values_.push_back(value);
  return 0;
}

bool SparseMatrix::AllFinite() const
{
  for(size_t j=0; j<values_.size(); ++j) {
    if(!std::isfinite(values_[j])) {
      return false;
    }
  }
  return true;
}

void SparseMatrix::Multiply(const double x[], double y[]) const
{
  for(int j=0; j<num_rows_; ++j) {
    y[j] = 0.0;
  }
  for(size_t k=0; k<values_.size(); ++k) {
    y[rows_[k]] += values_[k]*x[cols_[k]];
  }
}

void SparseMatrix::ToDense(std::vector<double> *dense) const
{
  dense->assign(num_rows_*num_rows_, 0.0);
  for(size_t k=0; k<values_.size(); ++k) {
    (*dense)[cols_[k]*num_rows_ + rows_[k]] += values_[k];
  }
}

void SparseMatrix::ToCompressedColumn(CompressedColumnPattern *pattern,
                                      std::vector<double> *values) const
{
  std::vector<const SparseMatrix *> matrices(1, this);
  std::vector<std::vector<int> > maps;
  BuildUnionPattern(num_rows_, matrices, pattern, &maps);

  values->assign(pattern->num_nonzeros(), 0.0);
  for(size_t k=0; k<values_.size(); ++k) {
    (*values)[maps[0][k]] += values_[k];
  }
}

void BuildUnionPattern(const int num_rows,
                       const std::vector<const SparseMatrix *> &matrices,
                       CompressedColumnPattern *pattern,
                       std::vector<std::vector<int> > *maps)
{
  typedef std::pair<int, int> ColRow;
  std::vector<ColRow> positions;

  size_t num_triplets = num_rows;
  for(size_t m=0; m<matrices.size(); ++m) {
    if(matrices[m] != NULL) {
      num_triplets += matrices[m]->num_entries();
    }
  }
  positions.reserve(num_triplets);

  for(int j=0; j<num_rows; ++j) {
    positions.push_back(ColRow(j,j));
  }
  for(size_t m=0; m<matrices.size(); ++m) {
    if(matrices[m] != NULL) {
      const std::vector<int> &rows = matrices[m]->rows();
      const std::vector<int> &cols = matrices[m]->cols();
      for(size_t k=0; k<rows.size(); ++k) {
        positions.push_back(ColRow(cols[k],rows[k]));
      }
    }
  }
  std::sort(positions.begin(), positions.end());
  positions.erase(std::unique(positions.begin(), positions.end()),
                  positions.end());

  pattern->num_rows = num_rows;
  pattern->column_sums.assign(num_rows+1, 0);
  pattern->row_indexes.resize(positions.size());
  for(size_t k=0; k<positions.size(); ++k) {
    pattern->column_sums[positions[k].first+1] += 1;
    pattern->row_indexes[k] = positions[k].second;
  }
  for(int j=0; j<num_rows; ++j) {
    pattern->column_sums[j+1] += pattern->column_sums[j];
  }

  maps->assign(matrices.size(), std::vector<int>());
  for(size_t m=0; m<matrices.size(); ++m) {
    if(matrices[m] != NULL) {
      const std::vector<int> &rows = matrices[m]->rows();
      const std::vector<int> &cols = matrices[m]->cols();
      (*maps)[m].resize(rows.size());
      for(size_t k=0; k<rows.size(); ++k) {
        (*maps)[m][k] = pattern->Find(rows[k], cols[k]);
      }
    }
  }
}

} // namespace stiffrk
