#include "pixedit/history.hpp"
#include "pixedit/errors.hpp"

#include <utility>

namespace pe {

void HistoryManager::push_undo(const RasterBuffer& buffer) {
    undo_.push_back(buffer.clone());
    while (undo_.size() > kMaxUndoDepth) {
        undo_.pop_front();
    }
}

void HistoryManager::push_redo(const RasterBuffer& buffer) {
    redo_.push_back(buffer.clone());
}

RasterBuffer HistoryManager::pop_undo() {
    if (undo_.empty()) {
        throw HistoryEmpty("pop_undo: nothing to undo");
    }
    RasterBuffer top = std::move(undo_.back());
    undo_.pop_back();
    return top;
}

RasterBuffer HistoryManager::pop_redo() {
    if (redo_.empty()) {
        throw HistoryEmpty("pop_redo: nothing to redo");
    }
    RasterBuffer top = std::move(redo_.back());
    redo_.pop_back();
    return top;
}

void HistoryManager::clear_redo() {
    redo_.clear();
}

void HistoryManager::clear() {
    undo_.clear();
    redo_.clear();
}

} // namespace pe
