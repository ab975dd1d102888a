#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace reposcope::engine {

    struct SearchHit {
        size_t row = 0;
        float score = 0.0f;
    };

    /**
     * @brief Dense matrix of L2-normalized embeddings with exact top-k cosine search.
     *
     * Row i corresponds to chunk i of the snapshot the index was built for.
     * build() constructs a new matrix and swaps it in whole; concurrent search() calls
     * keep using the matrix they started with.
     */
    class VectorIndex {
    public:
        VectorIndex();
        ~VectorIndex();

        VectorIndex(const VectorIndex&) = delete;
        VectorIndex& operator=(const VectorIndex&) = delete;

        /**
         * @brief Replaces the index contents with the normalized vectors.
         * @throws IndexIntegrityError if the vectors do not share one non-zero dimension.
         */
        void build(const std::vector<std::vector<float>>& vectors);

        /**
         * @brief Top-k rows by cosine similarity, score descending, ties by lower row.
         *
         * top_k is clamped to row_count(). Returns an empty result for an empty index or a
         * query whose dimension differs from the index.
         */
        std::vector<SearchHit> search(const std::vector<float>& query, size_t top_k) const;

        size_t row_count() const;
        size_t dimension() const;

        /**
         * @brief Copy of the stored (normalized) rows, in row order.
         */
        std::vector<std::vector<float>> rows() const;

        /**
         * @brief Scales v to unit length in place. A zero vector is left unchanged.
         */
        static void normalize(std::vector<float>& v);

    private:
        struct Matrix;

        mutable std::mutex m_mutex;
        std::shared_ptr<const Matrix> m_matrix;

        std::shared_ptr<const Matrix> current() const;
    };

}
