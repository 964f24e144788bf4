/**
 * Reference function table.
 *
 * Read-only mapping from function label to reference embedding, kept in
 * insertion order. Built once at startup and shared by every analysis;
 * concurrent reads need no locking because nothing mutates it after
 * construction.
 */

#pragma once

#include "protscope/modules/embedding/embedder.h"
#include <cstddef>
#include <string>
#include <vector>

namespace protscope {
namespace function {

struct ReferenceEntry {
    std::string label;
    embedding::Embedding vector;
};

class ReferenceFunctionTable {
public:
    /**
     * @param entries Labels and vectors in insertion order
     * @param source  Where the entries came from, used in error messages
     * @throws EmptyReferenceTableError if entries is empty
     * @throws DimensionError if vectors differ in length
     * @throws ValidationError on an empty or duplicate label
     */
    explicit ReferenceFunctionTable(std::vector<ReferenceEntry> entries,
                                    const std::string& source = "");

    std::size_t size() const { return entries_.size(); }
    std::size_t dimension() const { return entries_.front().vector.size(); }
    const ReferenceEntry& operator[](std::size_t i) const { return entries_[i]; }
    const std::vector<ReferenceEntry>& entries() const { return entries_; }

    std::vector<ReferenceEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<ReferenceEntry>::const_iterator end() const { return entries_.end(); }

    // Labels in insertion order, for display.
    std::vector<std::string> labels() const;

    bool contains(const std::string& label) const;

private:
    std::vector<ReferenceEntry> entries_;
};

/**
 * Built-in table: enzyme, transport, signaling, DNA/RNA binding, structural.
 *
 * Each entry is the embedding of a residue-composition prototype for that
 * function class. Constructed on first use (thread-safe static init).
 */
const ReferenceFunctionTable& builtin_reference_table();

}  // namespace function
}  // namespace protscope
