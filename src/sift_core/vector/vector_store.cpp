#include "sift_core/vector/vector_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <mutex>

namespace sift_core {

// Lets FAISS skip hidden, deleted and filtered-out records during the scan itself.
class VectorStore::FilterSelector : public faiss::IDSelector {
 public:
  FilterSelector(const std::unordered_map<int64_t, Entry> &entries, const VectorFilter &filter)
      : entries_(entries), filter_(filter) {}

  bool is_member(faiss::idx_t id) const override {
    auto it = entries_.find(static_cast<int64_t>(id));
    if (it == entries_.end()) {
      return false;
    }
    return VectorStore::matches(it->second, filter_);
  }

 private:
  const std::unordered_map<int64_t, Entry> &entries_;
  const VectorFilter &filter_;
};

VectorStore::VectorStore(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw ConfigurationError("Vector dimensions must be greater than 0, got " +
                             std::to_string(dimensions_));
  }
  auto *base_index = new faiss::IndexFlatIP(dimensions_);
  index_ = std::make_unique<faiss::IndexIDMap2>(base_index);
  index_->own_fields = true;
}

VectorStore::~VectorStore() = default;

void VectorStore::upsert(const std::vector<VectorRecord> &records, bool visible) {
  if (records.empty()) {
    return;
  }
  for (const auto &record : records) {
    validate_vector_dimension(record.vector);
  }

  std::vector<float> flat;
  flat.reserve(records.size() * dimensions_);
  std::vector<faiss::idx_t> ids;
  ids.reserve(records.size());
  for (const auto &record : records) {
    flat.insert(flat.end(), record.vector.begin(), record.vector.end());
    ids.push_back(static_cast<faiss::idx_t>(record.chunk_id));
  }
  faiss::fvec_renorm_L2(dimensions_, records.size(), flat.data());

  std::unique_lock lock(mutex_);
  std::vector<int64_t> existing;
  for (const auto &record : records) {
    if (entries_.count(record.chunk_id)) {
      existing.push_back(record.chunk_id);
    }
  }
  remove_locked(existing);

  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(records.size()), flat.data(), ids.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError(std::string("Failed to add vectors to index: ") + e.what());
  }
  for (const auto &record : records) {
    entries_[record.chunk_id] = Entry{record.document_id, record.version, record.knowledge_base,
                                      record.doc_class, record.language, record.created_at,
                                      visible, false};
  }
}

void VectorStore::publish(const std::vector<int64_t> &chunk_ids) {
  std::unique_lock lock(mutex_);
  for (int64_t id : chunk_ids) {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
      it->second.visible = true;
    }
  }
}

void VectorStore::mark_deleted(const std::vector<int64_t> &chunk_ids) {
  std::unique_lock lock(mutex_);
  for (int64_t id : chunk_ids) {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
      it->second.deleted = true;
    }
  }
}

void VectorStore::remove(const std::vector<int64_t> &chunk_ids) {
  std::unique_lock lock(mutex_);
  remove_locked(chunk_ids);
}

void VectorStore::clear() {
  std::unique_lock lock(mutex_);
  index_->reset();
  entries_.clear();
}

std::vector<VectorHit> VectorStore::search(const std::vector<float> &query,
                                           size_t k,
                                           const VectorFilter &filter) const {
  validate_vector_dimension(query);
  if (k == 0) {
    return {};
  }

  std::vector<float> normalized = query;
  faiss::fvec_renorm_L2(dimensions_, 1, normalized.data());

  std::shared_lock lock(mutex_);
  if (index_->ntotal == 0) {
    return {};
  }
  const auto actual_k = static_cast<faiss::idx_t>(std::min<size_t>(k, index_->ntotal));

  FilterSelector selector(entries_, filter);
  faiss::SearchParameters params;
  params.sel = &selector;

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, normalized.data(), actual_k, distances.data(), labels.data(), &params);
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError(std::string("Vector search failed: ") + e.what());
  }

  std::vector<VectorHit> hits;
  hits.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    // Fewer matches than k are padded with -1
    if (labels[i] < 0) {
      continue;
    }
    hits.push_back({static_cast<int64_t>(labels[i]), distances[i]});
  }
  std::stable_sort(hits.begin(), hits.end(), [](const VectorHit &a, const VectorHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
  });
  return hits;
}

size_t VectorStore::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

size_t VectorStore::searchable_size() const {
  std::shared_lock lock(mutex_);
  return std::count_if(entries_.begin(), entries_.end(),
                       [](const auto &pair) { return pair.second.visible && !pair.second.deleted; });
}

void VectorStore::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != static_cast<size_t>(dimensions_)) {
    throw VectorStoreError("Vector dimension mismatch. Expected " + std::to_string(dimensions_) +
                           ", got " + std::to_string(vector.size()));
  }
}

void VectorStore::remove_locked(const std::vector<int64_t> &chunk_ids) {
  std::vector<faiss::idx_t> ids;
  for (int64_t id : chunk_ids) {
    if (entries_.erase(id)) {
      ids.push_back(static_cast<faiss::idx_t>(id));
    }
  }
  if (ids.empty()) {
    return;
  }
  faiss::IDSelectorBatch selector(ids.size(), ids.data());
  index_->remove_ids(selector);
}

bool VectorStore::matches(const Entry &entry, const VectorFilter &filter) {
  if (!entry.visible || entry.deleted) {
    return false;
  }
  const SearchFilters &f = filter.filters;
  if (!f.classes.empty() &&
      std::find(f.classes.begin(), f.classes.end(), entry.doc_class) == f.classes.end()) {
    return false;
  }
  if (!f.languages.empty() &&
      std::find(f.languages.begin(), f.languages.end(), entry.language) == f.languages.end()) {
    return false;
  }
  if (!f.document_ids.empty() && std::find(f.document_ids.begin(), f.document_ids.end(),
                                           entry.document_id) == f.document_ids.end()) {
    return false;
  }
  if (f.created_from && entry.created_at < *f.created_from) {
    return false;
  }
  if (f.created_to && entry.created_at > *f.created_to) {
    return false;
  }
  if (f.knowledge_base && entry.knowledge_base != *f.knowledge_base) {
    return false;
  }
  if (std::find(filter.exclude_document_ids.begin(), filter.exclude_document_ids.end(),
                entry.document_id) != filter.exclude_document_ids.end()) {
    return false;
  }
  return true;
}

}  // namespace sift_core
