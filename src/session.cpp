#include "pixedit/session.hpp"
#include "pixedit/errors.hpp"
#include "pixedit/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace pe {

// ============================================================
// 單一飛行旗標：建構時搶 processing_，解構時放掉
// ============================================================
class EditSession::FlightGuard {
public:
    FlightGuard(std::atomic<bool>& flag, const char* op)
        : flag_(&flag)
    {
        bool expected = false;
        if (!flag.compare_exchange_strong(expected, true)) {
            flag_ = nullptr;
            logger()->warn("{} rejected: another edit is still in flight", op);
            throw SessionBusy(std::string(op) + ": another edit is still in flight");
        }
    }

    FlightGuard(FlightGuard&& other) noexcept
        : flag_(std::exchange(other.flag_, nullptr)) {}

    FlightGuard(const FlightGuard&)            = delete;
    FlightGuard& operator=(const FlightGuard&) = delete;
    FlightGuard& operator=(FlightGuard&&)      = delete;

    ~FlightGuard() {
        if (flag_) flag_->store(false);
    }

private:
    std::atomic<bool>* flag_;
};

// 直方圖失敗只代表「沒有直方圖」，不讓編輯失敗
static std::optional<ImageHistogram> try_histogram(const RasterBuffer& buffer) {
    try {
        return compute_histogram(buffer);
    } catch (const std::exception& e) {
        logger()->warn("histogram unavailable: {}", e.what());
        return std::nullopt;
    }
}

static std::shared_ptr<const RasterBuffer> share(RasterBuffer&& buffer) {
    return std::make_shared<RasterBuffer>(std::move(buffer));
}

// ============================================================
// 變更操作
// ============================================================

RasterSnapshot EditSession::load(RasterBuffer buffer) {
    FlightGuard guard(processing_, "load");
    require_valid(buffer, "load");

    auto original = share(std::move(buffer));
    auto current  = share(original->clone());
    auto hist     = try_histogram(*current);

    std::lock_guard<std::mutex> lock(mutex_);
    original_  = std::move(original);
    current_   = std::move(current);
    histogram_ = std::move(hist);
    history_.clear();
    dirty_ = false;

    logger()->debug("load: {}x{}", current_->width(), current_->height());
    return {current_, histogram_};
}

RasterSnapshot EditSession::apply(FilterKind kind, const FilterParameters& params) {
    FlightGuard guard(processing_, "apply");
    return apply_claimed(kind, params);
}

std::future<RasterSnapshot> EditSession::submit_apply(FilterKind kind, FilterParameters params) {
    FlightGuard guard(processing_, "submit_apply");

    return std::async(std::launch::async,
        [this, kind, params, guard = std::move(guard)]() mutable {
            // 在工作函式內放掉旗標，future 變成 ready 之前就能接受下一個請求
            FlightGuard held = std::move(guard);
            return apply_claimed(kind, params);
        });
}

RasterSnapshot EditSession::apply_claimed(FilterKind kind, const FilterParameters& params) {
    std::shared_ptr<const RasterBuffer> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = current_;
    }
    if (!source) {
        throw NoCurrentImage(std::string("apply ") + filter_name(kind) + ": no image loaded");
    }

    // None 不算編輯：歷史、redo、dirty 都不動
    if (kind == FilterKind::None) {
        std::lock_guard<std::mutex> lock(mutex_);
        return {current_, histogram_};
    }

    // 重的計算不持有 mutex；只有 processing_ 擋住其他變更
    auto result = share(transform(*source, kind, params));
    auto hist   = try_histogram(*result);

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_undo(*source);
    history_.clear_redo();
    current_   = std::move(result);
    histogram_ = std::move(hist);
    dirty_ = true;

    logger()->debug("apply {}: undo={} redo={}",
                    filter_name(kind), history_.undo_depth(), history_.redo_depth());
    return {current_, histogram_};
}

RasterSnapshot EditSession::undo() {
    FlightGuard guard(processing_, "undo");

    std::lock_guard<std::mutex> lock(mutex_);
    if (!history_.can_undo()) {
        throw HistoryEmpty("undo: nothing to undo");
    }
    if (!current_) {
        throw NoCurrentImage("undo: no image loaded");
    }

    history_.push_redo(*current_);
    current_   = share(history_.pop_undo());
    histogram_ = try_histogram(*current_);
    dirty_ = history_.can_undo();

    logger()->debug("undo: undo={} redo={}", history_.undo_depth(), history_.redo_depth());
    return {current_, histogram_};
}

RasterSnapshot EditSession::redo() {
    FlightGuard guard(processing_, "redo");

    std::lock_guard<std::mutex> lock(mutex_);
    if (!history_.can_redo()) {
        throw HistoryEmpty("redo: nothing to redo");
    }
    if (!current_) {
        throw NoCurrentImage("redo: no image loaded");
    }

    // 這裡不清 redo，連續 redo 才能一路重播
    history_.push_undo(*current_);
    current_   = share(history_.pop_redo());
    histogram_ = try_histogram(*current_);
    dirty_ = true;

    logger()->debug("redo: undo={} redo={}", history_.undo_depth(), history_.redo_depth());
    return {current_, histogram_};
}

RasterSnapshot EditSession::reset() {
    FlightGuard guard(processing_, "reset");

    std::lock_guard<std::mutex> lock(mutex_);
    if (!original_) {
        throw NoOriginalImage("reset: no image loaded");
    }

    if (current_) {
        history_.push_undo(*current_);
    }
    current_   = share(original_->clone());
    histogram_ = try_histogram(*current_);
    dirty_ = false;

    logger()->debug("reset: undo={} redo={}", history_.undo_depth(), history_.redo_depth());
    return {current_, histogram_};
}

void EditSession::mark_saved() {
    std::lock_guard<std::mutex> lock(mutex_);
    dirty_ = false;
}

// ============================================================
// 唯讀查詢
// ============================================================

std::shared_ptr<const RasterBuffer> EditSession::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const RasterBuffer> EditSession::original() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return original_;
}

std::optional<ImageHistogram> EditSession::histogram() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return histogram_;
}

RasterSnapshot EditSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {current_, histogram_};
}

bool EditSession::loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(current_);
}

bool EditSession::can_undo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.can_undo();
}

bool EditSession::can_redo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.can_redo();
}

bool EditSession::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

std::size_t EditSession::undo_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.undo_depth();
}

std::size_t EditSession::redo_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.redo_depth();
}

// ============================================================
// 函式介面
// ============================================================

std::unique_ptr<EditSession> load_raster(const std::vector<std::uint8_t>& bytes,
                                         std::uint32_t width,
                                         std::uint32_t height) {
    RasterBuffer buffer(width, height, bytes);
    auto session = std::make_unique<EditSession>();
    session->load(std::move(buffer));
    return session;
}

RasterSnapshot apply_filter(EditSession& session,
                            FilterKind kind,
                            const FilterParameters& params) {
    return session.apply(kind, params);
}

RasterSnapshot undo(EditSession& session)  { return session.undo(); }
RasterSnapshot redo(EditSession& session)  { return session.redo(); }
RasterSnapshot reset(EditSession& session) { return session.reset(); }

std::shared_ptr<const RasterBuffer> current_buffer(const EditSession& session) {
    return session.current();
}

} // namespace pe
