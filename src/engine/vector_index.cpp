#include "vector_index.hpp"
#include "reposcope/types.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace reposcope::engine {

    struct VectorIndex::Matrix {
        size_t dim = 0;
        size_t rows = 0;
        std::vector<float> data; // row-major, rows * dim
        std::unique_ptr<hnswlib::InnerProductSpace> space;

        const float* row(size_t i) const { return data.data() + i * dim; }
    };

    VectorIndex::VectorIndex() : m_matrix(std::make_shared<Matrix>()) {}

    VectorIndex::~VectorIndex() = default;

    void VectorIndex::normalize(std::vector<float>& v) {
        double norm = 0.0;
        for (float x : v) norm += static_cast<double>(x) * x;
        if (norm <= 0.0) return;
        const float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) x *= inv;
    }

    void VectorIndex::build(const std::vector<std::vector<float>>& vectors) {
        auto matrix = std::make_shared<Matrix>();

        if (!vectors.empty()) {
            const size_t dim = vectors.front().size();
            if (dim == 0) throw IndexIntegrityError("vector index: zero-dimensional vectors");

            matrix->dim = dim;
            matrix->rows = vectors.size();
            matrix->data.reserve(vectors.size() * dim);
            for (size_t i = 0; i < vectors.size(); ++i) {
                if (vectors[i].size() != dim) {
                    throw IndexIntegrityError("vector index: row " + std::to_string(i) + " has dimension " +
                                              std::to_string(vectors[i].size()) + ", expected " + std::to_string(dim));
                }
                std::vector<float> row = vectors[i];
                normalize(row);
                matrix->data.insert(matrix->data.end(), row.begin(), row.end());
            }
            matrix->space = std::make_unique<hnswlib::InnerProductSpace>(dim);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_matrix = std::move(matrix);
    }

    std::shared_ptr<const VectorIndex::Matrix> VectorIndex::current() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_matrix;
    }

    std::vector<SearchHit> VectorIndex::search(const std::vector<float>& query, size_t top_k) const {
        std::vector<SearchHit> hits;
        auto matrix = current();
        if (matrix->rows == 0 || top_k == 0) return hits;

        if (query.size() != matrix->dim) {
            std::cerr << "[VectorIndex] Query dimension " << query.size() << " does not match index dimension " << matrix->dim << "\n";
            return hits;
        }

        std::vector<float> q = query;
        normalize(q);

        // InnerProductSpace distance is 1 - <a, b>.
        auto dist = matrix->space->get_dist_func();
        void* param = matrix->space->get_dist_func_param();

        hits.reserve(matrix->rows);
        for (size_t i = 0; i < matrix->rows; ++i) {
            float score = 1.0f - dist(q.data(), matrix->row(i), param);
            hits.push_back({i, std::clamp(score, -1.0f, 1.0f)});
        }

        const size_t k = std::min(top_k, hits.size());
        std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), [](const SearchHit& a, const SearchHit& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.row < b.row;
        });
        hits.resize(k);
        return hits;
    }

    size_t VectorIndex::row_count() const {
        return current()->rows;
    }

    size_t VectorIndex::dimension() const {
        return current()->dim;
    }

    std::vector<std::vector<float>> VectorIndex::rows() const {
        auto matrix = current();
        std::vector<std::vector<float>> out;
        out.reserve(matrix->rows);
        for (size_t i = 0; i < matrix->rows; ++i) {
            out.emplace_back(matrix->row(i), matrix->row(i) + matrix->dim);
        }
        return out;
    }

}
