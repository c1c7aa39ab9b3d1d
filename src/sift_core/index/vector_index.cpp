#include "sift_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <stdexcept>

namespace sift_core {

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::Hnsw:
      return "hnsw";
    default:
      return "flat";
  }
}

IndexKind index_kind_from_string(const std::string &str) {
  if (str == "flat")
    return IndexKind::Flat;
  if (str == "hnsw")
    return IndexKind::Hnsw;
  throw std::invalid_argument("Unknown index kind: " + str);
}

namespace {

std::unique_ptr<faiss::Index> create_base_index(size_t dimension, IndexKind kind) {
  const auto d = static_cast<faiss::idx_t>(dimension);
  if (kind == IndexKind::Hnsw) {
    auto index = std::make_unique<faiss::IndexHNSWFlat>(d, VectorIndex::HNSW_M_PARAM);
    index->hnsw.efConstruction = VectorIndex::HNSW_EF_CONSTRUCTION_PARAM;
    index->hnsw.efSearch = VectorIndex::HNSW_EF_SEARCH_PARAM;
    return index;
  }
  return std::make_unique<faiss::IndexFlatL2>(d);
}

}  // namespace

VectorIndex::VectorIndex(size_t dimension, IndexKind kind) : dimension_(dimension), kind_(kind) {
  if (dimension == 0) {
    throw VectorIndexError("Vector dimension must be positive");
  }
  try {
    index_ = create_base_index(dimension, kind);
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to create " + to_string(kind) + " index: " + e.what());
  }
}

VectorIndex::VectorIndex(std::unique_ptr<faiss::Index> index, IndexKind kind)
    : index_(std::move(index)), dimension_(static_cast<size_t>(index_->d)), kind_(kind) {}

void VectorIndex::add(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return;
  }
  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension_);
  for (const auto &v : vectors) {
    if (v.size() != dimension_) {
      throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                             ", got " + std::to_string(v.size()));
    }
    flat.insert(flat.end(), v.begin(), v.end());
  }
  try {
    index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError(std::string("faiss add failed: ") + e.what());
  }
}

std::vector<Neighbor> VectorIndex::search(const std::vector<float> &query, size_t k) const {
  if (query.size() != dimension_) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " + std::to_string(query.size()));
  }
  const auto actual_k = static_cast<faiss::idx_t>(std::min(k, size()));
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError(std::string("faiss search failed: ") + e.what());
  }

  std::vector<Neighbor> neighbors;
  neighbors.reserve(labels.size());
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    // HNSW pads with -1 when it finds fewer than k neighbours.
    if (labels[i] < 0) {
      continue;
    }
    neighbors.push_back(Neighbor{.position = static_cast<size_t>(labels[i]), .distance = distances[i]});
  }
  return neighbors;
}

void VectorIndex::write(const std::filesystem::path &path) const {
  try {
    faiss::write_index(index_.get(), path.c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to write vector index " + path.string() + ": " + e.what());
  }
}

VectorIndex VectorIndex::read(const std::filesystem::path &path) {
  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to read vector index " + path.string() + ": " + e.what());
  }
  if (auto *hnsw = dynamic_cast<faiss::IndexHNSWFlat *>(index.get())) {
    hnsw->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
    return VectorIndex(std::move(index), IndexKind::Hnsw);
  }
  if (dynamic_cast<faiss::IndexFlatL2 *>(index.get()) == nullptr) {
    throw VectorIndexError("Unsupported faiss index type in " + path.string());
  }
  return VectorIndex(std::move(index), IndexKind::Flat);
}

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

}  // namespace sift_core
