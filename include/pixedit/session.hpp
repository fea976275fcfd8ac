#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "pixedit/filters.hpp"
#include "pixedit/histogram.hpp"
#include "pixedit/history.hpp"
#include "pixedit/raster.hpp"

namespace pe {

// 一次變更操作完成後的結果：目前的影像（不可變、可共享）+ 直方圖。
// 直方圖算失敗時為 nullopt，不影響編輯本身。
struct RasterSnapshot {
    std::shared_ptr<const RasterBuffer> buffer;
    std::optional<ImageHistogram> histogram;
};

// ------------------------------------------------------------
// EditSession
//
// 持有 current / original 兩張影像、undo / redo 歷史與 dirty 旗標。
//
// load / apply / undo / redo / reset 同一時間只允許一個在執行；
// 已有操作在跑時，新的請求直接丟 SessionBusy，不排隊。
// 唯讀查詢（current、can_undo ...）任何時候都可以呼叫。
// ------------------------------------------------------------
class EditSession {
public:
    EditSession() = default;

    EditSession(const EditSession&)            = delete;
    EditSession& operator=(const EditSession&) = delete;

    // original := buffer，current := clone，清空歷史，dirty = false
    RasterSnapshot load(RasterBuffer buffer);

    // 對 current 套用濾鏡；前一張進 undo，redo 清空，dirty = true。
    // FilterKind::None 什麼都不改，直接回傳目前的 snapshot
    RasterSnapshot apply(FilterKind kind, const FilterParameters& params);

    // 同 apply，但在背景執行緒計算。忙碌檢查在呼叫端執行緒上立即完成，
    // 所以忙碌時這裡就會丟 SessionBusy。
    // 回傳的 future 完成前，session 必須保持存活。
    std::future<RasterSnapshot> submit_apply(FilterKind kind, FilterParameters params);

    RasterSnapshot undo();
    RasterSnapshot redo();

    // current := clone(original)，前一張進 undo，dirty = false
    RasterSnapshot reset();

    // 存檔後呼叫；不碰歷史
    void mark_saved();

    std::shared_ptr<const RasterBuffer> current() const;
    std::shared_ptr<const RasterBuffer> original() const;
    std::optional<ImageHistogram> histogram() const;
    RasterSnapshot snapshot() const;

    bool loaded()   const;
    bool can_undo() const;
    bool can_redo() const;
    bool dirty()    const;
    bool busy()     const { return processing_.load(); }

    std::size_t undo_depth() const;
    std::size_t redo_depth() const;

private:
    class FlightGuard;

    RasterSnapshot apply_claimed(FilterKind kind, const FilterParameters& params);

    mutable std::mutex mutex_;
    std::atomic<bool>  processing_{false};

    std::shared_ptr<const RasterBuffer> current_;
    std::shared_ptr<const RasterBuffer> original_;
    std::optional<ImageHistogram>       histogram_;
    HistoryManager history_;
    bool dirty_ = false;
};

// ------------------------------------------------------------
// 函式介面（給 presentation layer）
// ------------------------------------------------------------

// bytes 長度不對時丟 InvalidDimensions
std::unique_ptr<EditSession> load_raster(const std::vector<std::uint8_t>& bytes,
                                         std::uint32_t width,
                                         std::uint32_t height);

RasterSnapshot apply_filter(EditSession& session,
                            FilterKind kind,
                            const FilterParameters& params);

RasterSnapshot undo(EditSession& session);
RasterSnapshot redo(EditSession& session);
RasterSnapshot reset(EditSession& session);

std::shared_ptr<const RasterBuffer> current_buffer(const EditSession& session);

} // namespace pe
