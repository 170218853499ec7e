// Copyright (c) Lawrence Livermore National Security, LLC and
// other Restream Project Developers. See the top-level LICENSE file for
// details.
//
// SPDX-License-Identifier: (BSD-3-Clause)

/**
 * @file source.hpp
 * @brief Abstract interface for one-shot item sources, and simple adapters.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace restream {

/// @brief A forward-only producer of items.
///
/// The only operation is pulling the next item. A source may not tolerate
/// being pulled again after it reported end-of-stream, so buffers stop
/// asking as soon as they have seen std::nullopt once.
template <typename Item>
class Source {
 public:
  using item_type = Item;

  virtual ~Source() = default;

  /// @brief Pull the next item, or std::nullopt at end-of-stream.
  virtual std::optional<Item> next() = 0;
};

/// @brief Yields copies of the elements of an owned container, front to back.
template <typename Container>
class ContainerSource final : public Source<typename Container::value_type> {
 public:
  using Item = typename Container::value_type;

  explicit ContainerSource(Container items) : items_(std::move(items)), it_(items_.begin()) {}

  ContainerSource(const ContainerSource&) = delete;
  ContainerSource& operator=(const ContainerSource&) = delete;

  std::optional<Item> next() override
  {
    if (it_ == items_.end()) {
      return std::nullopt;
    }
    return *it_++;
  }

 private:
  Container items_;
  typename Container::const_iterator it_;
};

/// @brief Adapts a generator callable to the Source interface.
template <typename Item>
class FunctionSource final : public Source<Item> {
 public:
  explicit FunctionSource(std::function<std::optional<Item>()> generator) : generator_(std::move(generator)) {}

  std::optional<Item> next() override { return generator_(); }

 private:
  std::function<std::optional<Item>()> generator_;
};

/// @brief Create a source over a copy of the given container.
template <typename Container>
std::unique_ptr<Source<typename Container::value_type>> make_container_source(Container items)
{
  return std::make_unique<ContainerSource<Container>>(std::move(items));
}

/// @brief Create a source from a generator callable.
template <typename Item>
std::unique_ptr<Source<Item>> make_function_source(std::function<std::optional<Item>()> generator)
{
  return std::make_unique<FunctionSource<Item>>(std::move(generator));
}

}  // namespace restream
