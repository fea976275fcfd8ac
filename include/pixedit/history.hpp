#pragma once

#include <cstddef>
#include <deque>
#include <vector>
#include "pixedit/raster.hpp"

namespace pe {

// undo / redo 堆疊。每個項目都是完整的 clone，不和呼叫端共用記憶體。
// undo 最多保留 kMaxUndoDepth 筆，超過時丟掉最舊的；redo 不設上限。
class HistoryManager {
public:
    static constexpr std::size_t kMaxUndoDepth = 20;

    HistoryManager() = default;

    HistoryManager(const HistoryManager&)            = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    void push_undo(const RasterBuffer& buffer);
    void push_redo(const RasterBuffer& buffer);

    // 空的時候丟 HistoryEmpty
    RasterBuffer pop_undo();
    RasterBuffer pop_redo();

    void clear_redo();
    void clear();

    bool can_undo() const { return !undo_.empty(); }
    bool can_redo() const { return !redo_.empty(); }

    std::size_t undo_depth() const { return undo_.size(); }
    std::size_t redo_depth() const { return redo_.size(); }

private:
    std::deque<RasterBuffer>  undo_;   // back 是最新的
    std::vector<RasterBuffer> redo_;
};

} // namespace pe
