#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace majcpp {

// Failure at the Graph Store boundary. Propagated to callers unchanged.
class GraphError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A relationship endpoint does not exist in the store.
class NotFoundError : public GraphError {
 public:
  explicit NotFoundError(const std::string& message, std::string missing_id = {})
      : GraphError(message), missing_id_(std::move(missing_id)) {}

  const std::string& missing_id() const noexcept { return missing_id_; }

 private:
  std::string missing_id_;
};

// A node with the same id is already stored. Nodes are immutable, so this is
// never resolved by overwriting.
class DuplicateEntityError : public GraphError {
 public:
  explicit DuplicateEntityError(const std::string& message, std::string id = {})
      : GraphError(message), id_(std::move(id)) {}

  const std::string& id() const noexcept { return id_; }

 private:
  std::string id_;
};

// The Embedder or Evaluator failed, or returned something unusable.
class CollaboratorError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace majcpp
