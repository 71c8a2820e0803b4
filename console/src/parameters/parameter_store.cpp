#include "parameter_store.h"

#include "console_ids.h"
#include "core/logging.h"
#include "device/device_session.h"
#include "protocol/wire_format.h"

#include <algorithm>
#include <cmath>

namespace Dspi::Console {

using DSP::FilterParams;
using DSP::FilterType;

namespace {

constexpr const char* kTag = "STORE";

ChannelState makeChannelState(Channel ch) {
    ChannelState state;
    state.bands.assign(bandCount(ch), FilterParams{});
    return state;
}

bool differsBeyond(float cached, float fetched, float epsilon) {
    return std::fabs(cached - fetched) > epsilon;
}

} // namespace

ParameterStore::ParameterStore(DeviceSession& session, float sampleRate)
    : session_(session)
    , sampleRate_(sampleRate)
{
    for (Channel ch : kAllChannels) {
        channels_[channelIndex(ch)] = makeChannelState(ch);
    }
}

// =============================================================================
// Device Reads
// =============================================================================

std::optional<float> ParameterStore::fetchFloat(uint8_t opcode, uint16_t value) {
    auto bytes = session_.sendGet(opcode, value, kScalarSize);
    if (!bytes) return std::nullopt;
    return decodeFloat(*bytes);
}

std::optional<bool> ParameterStore::fetchFlag(uint8_t opcode, uint16_t value) {
    auto bytes = session_.sendGet(opcode, value, kFlagSize);
    if (!bytes) return std::nullopt;
    return decodeFlag(*bytes);
}

std::optional<FilterParams> ParameterStore::fetchFilter(Channel ch, size_t band) {
    const auto ch8 = static_cast<uint8_t>(ch);
    const auto band8 = static_cast<uint8_t>(band);

    auto typeBytes = session_.sendGet(kGetFilterField, filterFieldAddress(ch8, band8, kFilterFieldType), kScalarSize);
    if (!typeBytes) return std::nullopt;
    auto typeRaw = decodeU32(*typeBytes);
    if (!typeRaw) return std::nullopt;

    auto freq = fetchFloat(kGetFilterField, filterFieldAddress(ch8, band8, kFilterFieldFrequency));
    if (!freq) return std::nullopt;
    auto q = fetchFloat(kGetFilterField, filterFieldAddress(ch8, band8, kFilterFieldQ));
    if (!q) return std::nullopt;
    auto gain = fetchFloat(kGetFilterField, filterFieldAddress(ch8, band8, kFilterFieldGain));
    if (!gain) return std::nullopt;

    FilterParams params;
    params.type = DSP::filterTypeFromRaw(*typeRaw);
    params.frequency = *freq;
    params.Q = *q;
    params.gainDb = *gain;
    return params;
}

bool ParameterStore::fetchAll() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetchCount_;
    }

    // Preamp first: no answer means the device is gone and nothing else is read
    const auto preamp = fetchFloat(kGetPreamp, 0);
    if (!preamp) {
        log(LogLevel::Warning, kTag, "Bulk fetch aborted, device did not answer");
        return false;
    }

    const auto bypass = fetchFlag(kGetBypass, 0);
    if (!bypass) return false;

    std::array<FetchedChannel, kNumChannels> fetched;
    for (Channel ch : kAllChannels) {
        auto& dst = fetched[channelIndex(ch)];
        dst.bands.reserve(bandCount(ch));

        for (size_t band = 0; band < bandCount(ch); ++band) {
            auto params = fetchFilter(ch, band);
            if (!params) return false;
            dst.bands.push_back(*params);
        }

        if (isOutput(ch)) {
            const auto value = static_cast<uint16_t>(ch);
            auto delay = fetchFloat(kGetDelay, value);
            if (!delay) return false;
            auto gain = fetchFloat(kGetChannelGain, value);
            if (!gain) return false;
            auto muted = fetchFlag(kGetChannelMute, value);
            if (!muted) return false;

            dst.delayMs = *delay;
            dst.gainDb = *gain;
            dst.muted = *muted;
        }
    }

    // Reconcile in one step so readers never see a half-applied fetch
    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool globalChanged = false;
        if (differsBeyond(global_.preampDb, *preamp, kPreampEpsilonDb)) {
            global_.preampDb = *preamp;
            globalChanged = true;
        }
        if (global_.bypass != *bypass) {
            global_.bypass = *bypass;
            globalChanged = true;
        }
        if (globalChanged) markChanged(ChangeKind::Global, changes);

        bool filtersChanged = false;
        bool delayChanged = false;
        bool outputChanged = false;
        for (Channel ch : kAllChannels) {
            auto& state = channels_[channelIndex(ch)];
            const auto& src = fetched[channelIndex(ch)];

            for (size_t band = 0; band < src.bands.size(); ++band) {
                if (state.bands[band] != src.bands[band]) {
                    state.bands[band] = src.bands[band];
                    filtersChanged = true;
                }
            }

            if (!isOutput(ch)) continue;

            if (differsBeyond(state.delayMs, src.delayMs, kDelayEpsilonMs)) {
                state.delayMs = src.delayMs;
                delayChanged = true;
            }
            if (differsBeyond(state.gainDb, src.gainDb, kGainEpsilonDb)) {
                state.gainDb = src.gainDb;
                outputChanged = true;
            }
            if (state.muted != src.muted) {
                state.muted = src.muted;
                outputChanged = true;
            }
        }

        if (filtersChanged) markChanged(ChangeKind::Filters, changes);
        if (delayChanged) markChanged(ChangeKind::Delay, changes);
        if (outputChanged) markChanged(ChangeKind::Output, changes);
    }

    log(LogLevel::Info, kTag, "Bulk fetch complete (%zu changes)", changes.size());
    notify(changes);
    return true;
}

bool ParameterStore::pollStatus() {
    auto bytes = session_.sendGet(kGetStatus, kStatusCombined, kStatusRecordSize);
    if (!bytes) return false;

    auto status = decodeStatus(*bytes);
    if (!status) return false;

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == *status) return true;
        status_ = *status;
        markChanged(ChangeKind::Status, changes);
    }
    notify(changes);
    return true;
}

void ParameterStore::updateBufferStats(const BufferStats& stats) {
    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stats_ == stats) return;
        stats_ = stats;
        markChanged(ChangeKind::Stats, changes);
    }
    notify(changes);
}

uint64_t ParameterStore::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchCount_;
}

// =============================================================================
// Optimistic Writes
// =============================================================================

void ParameterStore::sendFilter(Channel ch, size_t band, const FilterParams& params) {
    const auto record = encodeFilterRecord(static_cast<uint8_t>(ch), static_cast<uint8_t>(band), params);
    session_.sendSet(kSetFilter, 0, record);
}

bool ParameterStore::setFilter(Channel ch, size_t band, const FilterParams& params) {
    if (band >= bandCount(ch)) {
        log(LogLevel::Warning, kTag, "%s has no band %zu", channelName(ch), band);
        return false;
    }

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& cached = channels_[channelIndex(ch)].bands[band];
        if (cached != params) {
            cached = params;
            markChanged(ChangeKind::Filters, changes);
        }
    }

    sendFilter(ch, band, params);
    notify(changes);
    return true;
}

bool ParameterStore::setDelay(Channel ch, float ms) {
    if (!isOutput(ch)) return false;
    const float clamped = std::clamp(ms, kMinDelayMs, kMaxDelayMs);

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = channels_[channelIndex(ch)];
        if (state.delayMs != clamped) {
            state.delayMs = clamped;
            markChanged(ChangeKind::Delay, changes);
        }
    }

    session_.sendSet(kSetDelay, static_cast<uint16_t>(ch), encodeFloat(clamped));
    notify(changes);
    return true;
}

void ParameterStore::setPreampGain(float db) {
    const float clamped = std::clamp(db, kMinPreampDb, kMaxPreampDb);

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (global_.preampDb != clamped) {
            global_.preampDb = clamped;
            markChanged(ChangeKind::Global, changes);
        }
    }

    session_.sendSet(kSetPreamp, 0, encodeFloat(clamped));
    notify(changes);
}

void ParameterStore::setBypass(bool enabled) {
    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (global_.bypass != enabled) {
            global_.bypass = enabled;
            markChanged(ChangeKind::Global, changes);
        }
    }

    session_.sendSet(kSetBypass, 0, encodeFlag(enabled));
    notify(changes);
}

bool ParameterStore::setChannelGain(Channel ch, float db) {
    if (!isOutput(ch)) return false;

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = channels_[channelIndex(ch)];
        if (state.gainDb != db) {
            state.gainDb = db;
            markChanged(ChangeKind::Output, changes);
        }
    }

    session_.sendSet(kSetChannelGain, static_cast<uint16_t>(ch), encodeFloat(db));
    notify(changes);
    return true;
}

bool ParameterStore::setChannelMute(Channel ch, bool muted) {
    if (!isOutput(ch)) return false;

    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = channels_[channelIndex(ch)];
        if (state.muted != muted) {
            state.muted = muted;
            markChanged(ChangeKind::Output, changes);
        }
    }

    session_.sendSet(kSetChannelMute, static_cast<uint16_t>(ch), encodeFlag(muted));
    notify(changes);
    return true;
}

void ParameterStore::applyFilterSet(Channel ch, std::span<const FilterParams> filters) {
    for (size_t band = 0; band < bandCount(ch); ++band) {
        setFilter(ch, band, band < filters.size() ? filters[band] : FilterParams{});
    }
}

void ParameterStore::clearChannelBands(Channel ch) {
    applyFilterSet(ch, {});
}

void ParameterStore::clearMasterBands() {
    for (Channel ch : kInputChannels) {
        clearChannelBands(ch);
    }
}

// =============================================================================
// Display State
// =============================================================================

void ParameterStore::setVisibility(Channel ch, bool visible) {
    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = channels_[channelIndex(ch)];
        if (state.visible == visible) return;
        state.visible = visible;
        markChanged(ChangeKind::Visibility, changes);
    }
    notify(changes);
}

void ParameterStore::soloVisibility(std::optional<Channel> ch) {
    std::vector<ChangeKind> changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool changed = false;
        for (Channel other : kAllChannels) {
            const bool visible = !ch || *ch == other;
            auto& state = channels_[channelIndex(other)];
            if (state.visible != visible) {
                state.visible = visible;
                changed = true;
            }
        }
        if (!changed) return;
        markChanged(ChangeKind::Visibility, changes);
    }
    notify(changes);
}

// =============================================================================
// Reading
// =============================================================================

StateSnapshot ParameterStore::snapshot() const {
    StateSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.channels = channels_;
        snap.global = global_;
        snap.status = status_;
        snap.stats = stats_;
        snap.revision = revision_;
    }
    snap.connected = session_.isConnected();
    return snap;
}

uint64_t ParameterStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

std::vector<float> ParameterStore::channelResponse(Channel ch, size_t numPoints) const {
    std::vector<FilterParams> bands;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bypassAppliesTo(ch)) {
            return DSP::flatCurve(numPoints);
        }
        bands = channels_[channelIndex(ch)].bands;
    }
    return DSP::responseCurve(bands, numPoints, sampleRate_);
}

float ParameterStore::channelResponseDbAt(Channel ch, float frequency) const {
    std::vector<FilterParams> bands;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bypassAppliesTo(ch)) {
            return 0.0f;
        }
        bands = channels_[channelIndex(ch)].bands;
    }
    return DSP::responseDbAt(bands, frequency, sampleRate_);
}

// =============================================================================
// Change Notification
// =============================================================================

void ParameterStore::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

void ParameterStore::markChanged(ChangeKind kind, std::vector<ChangeKind>& changes) {
    ++revision_;
    changes.push_back(kind);
}

void ParameterStore::notify(const std::vector<ChangeKind>& changes) {
    if (changes.empty()) {
        return;
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (ChangeKind kind : changes) {
        for (const auto& listener : listeners) {
            listener(kind);
        }
    }
}

} // namespace Dspi::Console
