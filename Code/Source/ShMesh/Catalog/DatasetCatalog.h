/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef SHMESH_DATASET_CATALOG_H
#define SHMESH_DATASET_CATALOG_H

#include <map>
#include <string>
#include <vector>

namespace shmesh {

/**
 * @brief Location of a dataset within a snapshot: "<group>/<dataset>"
 */
struct DatasetRef {
  std::string group;
  std::string dataset;

  std::string path() const { return group + "/" + dataset; }

  bool operator==(const DatasetRef& other) const {
    return group == other.group && dataset == other.dataset;
  }
};

/**
 * @brief A dataset together with the index of one of its named columns
 */
struct ColumnRef {
  DatasetRef dataset;
  int index = -1;
};

/**
 * @brief Maps user-facing dataset names onto snapshot datasets
 *
 * The catalog holds the datasets of every particle group and the named
 * column tables of multi-column datasets. After setup_aliases() every
 * "<group>/<dataset>" resolves to itself, each group also exposes the
 * GroupNr_all and GroupNr_bound datasets, and each alias resolves to its
 * target. An alias inherits the named columns of its target dataset unless
 * it has a column table of its own.
 *
 * Lookups of unknown names throw NotFoundException.
 */
class DatasetCatalog {
public:
  DatasetCatalog() = default;

  /**
   * @brief Register a particle group and the datasets it holds
   *
   * Datasets are appended if the group is already known.
   */
  void add_group(const std::string& group, const std::vector<std::string>& datasets);

  /**
   * @brief Register the column names of a multi-column dataset, in column order
   */
  void add_named_columns(const std::string& dataset, const std::vector<std::string>& columns);

  /**
   * @brief Build the name map
   *
   * @param aliases alias path -> target path, both "<group>/<dataset>"
   * @throws InvalidArgumentException if a path is not of that form
   */
  void setup_aliases(const std::map<std::string, std::string>& aliases = {});

  bool has_group(const std::string& group) const { return groups_.count(group) > 0; }
  std::vector<std::string> groups() const;
  const std::vector<std::string>& datasets(const std::string& group) const;

  bool contains(const std::string& name) const;

  /**
   * @brief Every resolvable name, sorted
   */
  std::vector<std::string> names() const;

  DatasetRef resolve(const std::string& name) const;

  int column_index(const std::string& dataset, const std::string& column) const;

  /**
   * @brief Resolve a name and look up a column of its target dataset
   */
  ColumnRef resolve_column(const std::string& name, const std::string& column) const;

private:
  void require_aliases(const char* what) const;

  std::map<std::string, std::vector<std::string>> groups_;
  std::map<std::string, std::map<std::string, int>> named_columns_;
  std::map<std::string, DatasetRef> dataset_map_;
  bool aliases_ready_ = false;
};

} // namespace shmesh

#endif // SHMESH_DATASET_CATALOG_H
