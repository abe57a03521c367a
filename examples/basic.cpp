#include <textembed/text_embedding.hpp>

#include <iostream>

int main() {
  textembed::InitOptions opt;
  opt.model = textembed::EmbeddingModel::kBGESmallENV15;

  std::unique_ptr<textembed::TextEmbedding> model;
  auto s = textembed::TextEmbedding::Open(opt, &model);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<std::string> docs = {
      "passage: The quick brown fox jumps over the lazy dog.",
      "passage: Embeddings map text to points in a vector space.",
      "query: what does an embedding model do?",
  };

  std::vector<textembed::Embedding> vectors;
  s = model->Embed(docs, &vectors, 2);
  if (!s.ok()) {
    std::cerr << "Embed failed: " << s.ToString() << "\n";
    return 1;
  }

  // Vectors are unit length, so the dot product is the cosine similarity.
  const auto& query = vectors.back();
  for (size_t i = 0; i + 1 < vectors.size(); ++i) {
    float score = 0.0f;
    for (size_t d = 0; d < query.size(); ++d) score += query[d] * vectors[i][d];
    std::cout << score << "  " << docs[i] << "\n";
  }

  std::cout << "dim=" << query.size() << "\n";
  return 0;
}
