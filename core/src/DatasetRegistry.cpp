#include "tc/core/types/DatasetRegistry.hpp"

#include <stdexcept>
#include <utility>

#include "tc/core/util/Errors.hpp"

namespace tc
{

namespace
{

DatasetHandle lookup(const DatasetMap& map, const std::string& name, const char* role)
{
    auto it = map.find(name);
    if (it == map.end()) {
        throw UnknownDatasetError(
            std::string("no ") + role + " dataset named '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> keys(const DatasetMap& map)
{
    std::vector<std::string> out;
    out.reserve(map.size());
    for (const auto& [name, handle] : map) {
        out.push_back(name);
    }
    return out;
}

}  // namespace

// --- loading -----------------------------------------------------------------

std::set<StorageHandle> DatasetRegistry::reset()
{
    std::set<StorageHandle> held;
    for (const auto& slot : store_) {
        if (slot.dataset.hasStorage()) {
            held.insert(slot.dataset.storage());
        }
    }
    store_.clear();
    in_.clear();
    out_.clear();
    checkpoint_.clear();
    hasCheckpoint_ = false;
    endStage();
    return held;
}

Dataset& DatasetRegistry::createInput(const std::string& name)
{
    auto it = in_.find(name);
    if (it != in_.end()) {
        return at(it->second);
    }
    DatasetHandle h = append(Dataset(name));
    in_.emplace(name, h);
    return at(h);
}

void DatasetRegistry::captureCheckpoint()
{
    checkpoint_.clear();
    for (const auto& [name, handle] : in_) {
        checkpoint_.emplace(name, append(at(handle)));
    }
    hasCheckpoint_ = true;
}

void DatasetRegistry::restoreCheckpoint()
{
    if (!hasCheckpoint_) {
        throw std::logic_error("no checkpoint captured before restore");
    }
    for (const auto& [name, handle] : in_) {
        retire(handle);
    }
    for (const auto& [name, handle] : out_) {
        retire(handle);
    }
    in_.clear();
    for (const auto& [name, handle] : checkpoint_) {
        in_.emplace(name, append(at(handle)));
    }
    out_.clear();
    endStage();
}

// --- stage setup -------------------------------------------------------------

Dataset& DatasetRegistry::createOutput(const std::string& name)
{
    if (!declared_.insert(name).second) {
        throw DuplicateDatasetError(name);
    }
    auto it = out_.find(name);
    if (it != out_.end()) {
        return at(it->second);
    }
    DatasetHandle h = append(Dataset(name));
    out_.emplace(name, h);
    return at(h);
}

DatasetMap DatasetRegistry::snapshotOutputs()
{
    DatasetMap snapshot;
    for (const auto& [name, handle] : out_) {
        DatasetHandle copy = append(at(handle));
        retire(copy);
        snapshot.emplace(name, copy);
    }
    return snapshot;
}

void DatasetRegistry::installOutputs(const DatasetMap& snapshot)
{
    for (const auto& [name, handle] : out_) {
        retire(handle);
    }
    out_.clear();
    for (const auto& [name, handle] : snapshot) {
        out_.emplace(name, append(at(handle)));
    }
    declared_.clear();
}

// --- lookup ------------------------------------------------------------------

Dataset& DatasetRegistry::input(const std::string& name)
{
    return at(lookup(in_, name, "input"));
}

const Dataset& DatasetRegistry::input(const std::string& name) const
{
    return at(lookup(in_, name, "input"));
}

Dataset& DatasetRegistry::output(const std::string& name)
{
    return at(lookup(out_, name, "output"));
}

const Dataset& DatasetRegistry::output(const std::string& name) const
{
    return at(lookup(out_, name, "output"));
}

DatasetHandle DatasetRegistry::inputHandle(const std::string& name) const
{
    return lookup(in_, name, "input");
}

DatasetHandle DatasetRegistry::outputHandle(const std::string& name) const
{
    return lookup(out_, name, "output");
}

Dataset& DatasetRegistry::at(DatasetHandle handle)
{
    return store_.at(handle).dataset;
}

const Dataset& DatasetRegistry::at(DatasetHandle handle) const
{
    return store_.at(handle).dataset;
}

bool DatasetRegistry::isRetired(DatasetHandle handle) const
{
    return store_.at(handle).retired;
}

std::vector<std::string> DatasetRegistry::inputNames() const
{
    return keys(in_);
}

std::vector<std::string> DatasetRegistry::outputNames() const
{
    return keys(out_);
}

bool DatasetRegistry::storageInUse(StorageHandle handle) const
{
    auto holds = [&](const DatasetMap& map) {
        for (const auto& [name, h] : map) {
            if (at(h).storage() == handle) {
                return true;
            }
        }
        return false;
    };
    return handle != kNoStorage && (holds(in_) || holds(out_) || holds(checkpoint_));
}

// --- stage transitions -------------------------------------------------------

void DatasetRegistry::mergeOutputsIntoInputs()
{
    for (const auto& [name, handle] : out_) {
        if (at(handle).remove()) {
            retire(handle);
            continue;
        }
        auto prior = in_.find(name);
        if (prior != in_.end() && prior->second != handle) {
            retire(prior->second);
        }
        in_.insert_or_assign(name, handle);
    }
    out_.clear();
    endStage();
}

TransitionRecord DatasetRegistry::transitionRecord() const
{
    TransitionRecord record;
    for (const auto& [name, handle] : out_) {
        if (at(handle).remove()) {
            record.remove.push_back(handle);
        } else {
            record.keep.push_back(handle);
        }
        auto prior = in_.find(name);
        if (prior != in_.end()) {
            record.replace.push_back(prior->second);
        }
    }
    return record;
}

void DatasetRegistry::reorganise(const TransitionRecord& record)
{
    for (const auto& [name, handle] : in_) {
        at(handle).unreplicate();
    }

    for (auto handle : record.remove) {
        out_.erase(at(handle).name());
        retire(handle);
    }

    for (const auto& [name, handle] : out_) {
        auto prior = in_.find(name);
        if (prior != in_.end()) {
            retire(prior->second);
        }
        Dataset copy = at(handle);
        copy.clearPreview();
        in_.insert_or_assign(name, append(copy));
        retire(handle);
    }
    out_.clear();
    endStage();
}

TransitionRecord DatasetRegistry::finalise()
{
    TransitionRecord record = transitionRecord();
    reorganise(record);
    return record;
}

// --- iteration ---------------------------------------------------------------

void DatasetRegistry::registerAlternatingPair(const std::string& visible, const std::string& partner)
{
    if (visible == partner) {
        throw std::invalid_argument("dataset '" + visible + "' cannot alternate with itself");
    }
    const Dataset& a = output(visible);
    const Dataset& b = output(partner);
    if (a.shape() != b.shape()) {
        throw ShapeMismatchError(
            partner, b.hasCurrentPattern() ? b.currentPattern().name() : std::string(),
            "alternating buffer shape differs from '" + visible + "'");
    }
    for (const auto& p : pairs_) {
        if (p.visible == visible && p.partner == partner) {
            return;
        }
        if (p.visible == visible || p.partner == visible || p.visible == partner ||
            p.partner == partner) {
            throw std::logic_error(
                "dataset '" + visible + "' or '" + partner + "' is already paired");
        }
    }
    pairs_.push_back({visible, partner});
}

const AlternatingPair& DatasetRegistry::pair(const std::string& visible) const
{
    for (const auto& p : pairs_) {
        if (p.visible == visible) {
            return p;
        }
    }
    throw UnknownDatasetError("no alternating pair registered for '" + visible + "'");
}

const std::string& DatasetRegistry::alternatingWriter(
    const std::string& visible, std::size_t iteration) const
{
    const auto& p = pair(visible);
    return iteration % 2 == 0 ? p.visible : p.partner;
}

const std::string& DatasetRegistry::alternatingReader(
    const std::string& visible, std::size_t iteration) const
{
    const auto& p = pair(visible);
    return iteration % 2 == 0 ? p.partner : p.visible;
}

void DatasetRegistry::finaliseAlternatingPairs(std::size_t iterations)
{
    if (iterations == 0) {
        throw std::invalid_argument("alternating buffers need at least one iteration");
    }
    for (const auto& p : pairs_) {
        const bool partnerWrittenLast = (iterations - 1) % 2 == 1;
        if (partnerWrittenLast) {
            DatasetHandle v = outputHandle(p.visible);
            DatasetHandle w = outputHandle(p.partner);
            at(w).setName(p.visible);
            at(v).setName(p.partner);
            out_[p.visible] = w;
            out_[p.partner] = v;
        }
        output(p.visible).setRemove(false);
        output(p.partner).setRemove(true);
    }
    pairs_.clear();
}

// --- private -----------------------------------------------------------------

DatasetHandle DatasetRegistry::append(const Dataset& ds)
{
    store_.push_back(Slot{ds, false});
    return store_.size() - 1;
}

void DatasetRegistry::retire(DatasetHandle handle)
{
    store_.at(handle).retired = true;
}

void DatasetRegistry::endStage()
{
    declared_.clear();
    pairs_.clear();
}

}  // namespace tc
