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

#include "DatasetCatalog.h"
#include "../Core/Logger.h"
#include "../Core/ShMeshException.h"

#include <sstream>

namespace shmesh {

namespace {

const char* const GROUP_NR_DATASETS[] = {"GroupNr_all", "GroupNr_bound"};

DatasetRef split_path(const std::string& path) {
  const size_t slash = path.find('/');
  SHMESH_CHECK_ARG(slash != std::string::npos && slash > 0 && slash + 1 < path.size() &&
                   path.find('/', slash + 1) == std::string::npos,
                   "Dataset path \"" + path + "\" is not of the form <group>/<dataset>");
  return DatasetRef{path.substr(0, slash), path.substr(slash + 1)};
}

} // anonymous namespace

void DatasetCatalog::add_group(const std::string& group, const std::vector<std::string>& datasets) {
  SHMESH_CHECK_ARG(!group.empty(), "Dataset group name must not be empty");
  auto& list = groups_[group];
  list.insert(list.end(), datasets.begin(), datasets.end());
  aliases_ready_ = false;
}

void DatasetCatalog::add_named_columns(const std::string& dataset,
                                       const std::vector<std::string>& columns) {
  SHMESH_CHECK_ARG(!dataset.empty(), "Dataset name must not be empty");
  auto& table = named_columns_[dataset];
  table.clear();
  for (size_t i = 0; i < columns.size(); ++i) {
    table[columns[i]] = static_cast<int>(i);
  }
}

void DatasetCatalog::setup_aliases(const std::map<std::string, std::string>& aliases) {
  dataset_map_.clear();

  for (const auto& [group, datasets] : groups_) {
    for (const auto& dset : datasets) {
      dataset_map_[group + "/" + dset] = DatasetRef{group, dset};
    }
    for (const char* dset : GROUP_NR_DATASETS) {
      dataset_map_[group + "/" + dset] = DatasetRef{group, dset};
    }
  }

  for (const auto& [alias, target_path] : aliases) {
    const DatasetRef alias_ref = split_path(alias);
    const DatasetRef target = split_path(target_path);
    dataset_map_[alias] = target;

    auto target_cols = named_columns_.find(target.dataset);
    if (target_cols != named_columns_.end() && named_columns_.count(alias_ref.dataset) == 0) {
      named_columns_[alias_ref.dataset] = target_cols->second;
    }
  }

  aliases_ready_ = true;
  SHMESH_LOG_DEBUG("DatasetCatalog: " + std::to_string(dataset_map_.size()) + " names from " +
                   std::to_string(groups_.size()) + " groups and " +
                   std::to_string(aliases.size()) + " aliases");
}

std::vector<std::string> DatasetCatalog::groups() const {
  std::vector<std::string> names;
  names.reserve(groups_.size());
  for (const auto& entry : groups_) {
    names.push_back(entry.first);
  }
  return names;
}

const std::vector<std::string>& DatasetCatalog::datasets(const std::string& group) const {
  auto it = groups_.find(group);
  SHMESH_THROW_IF(it == groups_.end(), NotFoundException,
                  "Dataset group \"" + group + "\" not found");
  return it->second;
}

bool DatasetCatalog::contains(const std::string& name) const {
  return dataset_map_.count(name) > 0;
}

std::vector<std::string> DatasetCatalog::names() const {
  std::vector<std::string> result;
  result.reserve(dataset_map_.size());
  for (const auto& entry : dataset_map_) {
    result.push_back(entry.first);
  }
  return result;
}

DatasetRef DatasetCatalog::resolve(const std::string& name) const {
  require_aliases("resolve()");

  auto it = dataset_map_.find(name);
  if (it == dataset_map_.end()) {
    std::ostringstream msg;
    msg << "Dataset \"" << name << "\" not found! Available datasets:";
    for (const auto& entry : dataset_map_) {
      msg << "\n  " << entry.first;
    }
    SHMESH_LOG_ERROR(msg.str());
    SHMESH_THROW(NotFoundException, "Dataset \"" + name + "\" not found");
  }
  return it->second;
}

int DatasetCatalog::column_index(const std::string& dataset, const std::string& column) const {
  auto table = named_columns_.find(dataset);
  SHMESH_THROW_IF(table == named_columns_.end(), NotFoundException,
                  "Dataset \"" + dataset + "\" has no named columns");

  auto it = table->second.find(column);
  if (it == table->second.end()) {
    std::ostringstream msg;
    msg << "Column \"" << column << "\" not found in \"" << dataset << "\". Available columns:";
    for (const auto& entry : table->second) {
      msg << " " << entry.first;
    }
    SHMESH_LOG_ERROR(msg.str());
    SHMESH_THROW(NotFoundException, "Column \"" + column + "\" not found in \"" + dataset + "\"");
  }
  return it->second;
}

ColumnRef DatasetCatalog::resolve_column(const std::string& name, const std::string& column) const {
  ColumnRef ref;
  ref.dataset = resolve(name);
  ref.index = column_index(ref.dataset.dataset, column);
  return ref;
}

void DatasetCatalog::require_aliases(const char* what) const {
  SHMESH_THROW_IF(!aliases_ready_, ContractViolationException,
                  std::string("DatasetCatalog::") + what + " called before setup_aliases()");
}

} // namespace shmesh
