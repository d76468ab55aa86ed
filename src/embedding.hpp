#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace kankodori {

using Embedding = std::vector<float>;

// id -> vector for one modality. All vectors in one map share a length.
using EmbeddingMap = std::unordered_map<std::string, Embedding>;

enum class Modality { Text, Image };

std::string modality_to_string(Modality m);

// True for the empty vector and for a vector of all zeros. Both mean
// "no usable signal" and never score above 0.
bool is_zero_vector(const Embedding& v);

// Cosine similarity between two embedding vectors, clamped to [-1, 1].
// Returns 0.0 if either vector is empty, zero-magnitude, or the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const std::string& data);

} // namespace kankodori
