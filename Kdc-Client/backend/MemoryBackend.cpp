#include "MemoryBackend.hpp"
#include "core/macros.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace Kdc {

    namespace {
        bool PassMatches(const std::string &stored, const std::string &supplied) {
            return stored.empty() || stored == supplied;
        }
    }// namespace

    MemoryBackend::MemoryBackend(MemoryBackendOptions options)
        : options_(std::move(options)) {}

    MemoryBackend::Clock::time_point MemoryBackend::now() const {
        return options_.clock ? options_.clock() : Clock::now();
    }

    std::optional<MemoryBackend::Clock::time_point> MemoryBackend::deadlineOf(std::chrono::seconds ttl) const {
        if (ttl.count() <= 0) {
            return std::nullopt;
        }
        // 超出时钟可表示范围的 ttl 截断到最大时间点
        const auto current = now();
        const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - current);
        if (ttl >= headroom) {
            return Clock::time_point::max();
        }
        return current + ttl;
    }

    bool MemoryBackend::isExpired(const std::optional<Clock::time_point> &expire) const {
        return expire.has_value() && *expire <= now();
    }

    bool MemoryBackend::checkHandle(Handle handle) {
        return handles_.find(handle) != handles_.end();
    }

    bool MemoryBackend::succeed(Handle handle) {
        auto &codes = handles_[handle];
        codes.code = ResponseCode::Success;
        codes.subcode = ResponseSubcode::Nothing;
        return true;
    }

    bool MemoryBackend::fail(Handle handle, ResponseSubcode subcode) {
        auto &codes = handles_[handle];
        codes.code = ResponseCode::Error;
        codes.subcode = subcode;
        return false;
    }

    MemoryBackend::Entry *MemoryBackend::findLive(const std::string &key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        if (isExpired(it->second.expire)) {
            entries_.erase(it);
            return nullptr;
        }
        return &it->second;
    }

    void MemoryBackend::eraseTree(const std::string &key) {
        std::vector<std::string> visited;
        eraseTree(key, visited);
    }

    // 删除 key 的子键树，key 本身不会被删除（即使子键成环指回 key）
    void MemoryBackend::eraseChildren(const std::string &key, const StringList &children) {
        std::vector<std::string> visited{key};
        for (const auto &child: children) {
            eraseTree(child, visited);
        }
    }

    // 键队列元素对应的普通条目，只有在未被覆盖时才随元素一起删除
    void MemoryBackend::dropQueuedEntry(const QueueItem &item) {
        if (item.key.empty()) {
            return;
        }
        auto it = entries_.find(item.key);
        if (it != entries_.end() && it->second.value == item.value && it->second.pass == item.pass) {
            entries_.erase(it);
        }
    }

    // 子键之间可能成环，visited 防止重复进入
    void MemoryBackend::eraseTree(const std::string &key, std::vector<std::string> &visited) {
        if (std::find(visited.begin(), visited.end(), key) != visited.end()) {
            return;
        }
        visited.push_back(key);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return;
        }
        StringList children = std::move(it->second.subkeys);
        entries_.erase(it);
        for (const auto &child: children) {
            eraseTree(child, visited);
        }
    }

    void MemoryBackend::writeEntry(const std::string &key, const std::string &value, const std::string &pass,
                                   std::chrono::seconds ttl, size_t cas_width) {
        findLive(key);// 先淘汰已过期的旧条目，避免继承它的子键
        Entry &entry = entries_[key];
        entry.value = value;
        entry.pass = pass;
        entry.expire = deadlineOf(ttl);
        entry.cas_width = cas_width;
        entry.mtime = now();
    }

    Handle MemoryBackend::Open(const ClusterConfig &config) {
        std::ifstream in(config.GetPath(), std::ios::binary);
        if (!in.is_open()) {
            KDC_LOG_ERROR("Cannot read cluster config {}", config.GetPath());
            return kInvalidHandle;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        std::lock_guard<std::mutex> lock(mutex_);
        Handle handle = next_handle_++;
        handles_.emplace(handle, Codes());
        KDC_LOG_DEBUG("Opened handle {} (config {}, {} bytes, port {})",
                      handle, config.GetPath(), content.size(), config.GetPort());
        return handle;
    }

    bool MemoryBackend::Close(Handle handle, bool cleanup) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (it == handles_.end()) {
            return false;
        }
        handles_.erase(it);
        KDC_LOG_DEBUG("Closed handle {} (cleanup={})", handle, cleanup);
        return true;
    }

    std::optional<std::string> MemoryBackend::GetValue(Handle handle, const std::string &key, const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }
        if (!PassMatches(entry->pass, pass)) {
            fail(handle, ResponseSubcode::BadPassword);
            return std::nullopt;
        }
        succeed(handle);
        return entry->value;
    }

    bool MemoryBackend::SetValue(Handle handle, const std::string &key, const std::string &value,
                                 bool clear_subkeys, const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (entry && clear_subkeys) {
            StringList children = std::move(entry->subkeys);
            entry->subkeys.clear();
            eraseChildren(key, children);
        }
        writeEntry(key, value, pass, ttl, 0);
        return succeed(handle);
    }

    bool MemoryBackend::SetAll(Handle handle, const std::string &key, const std::string &value,
                               const StringList &subkeys, const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        writeEntry(key, value, pass, ttl, 0);
        entries_[key].subkeys = subkeys;
        return succeed(handle);
    }

    bool MemoryBackend::Remove(Handle handle, const std::string &key, bool remove_subkeys) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        if (!findLive(key)) {
            return fail(handle, ResponseSubcode::NoData);
        }
        if (remove_subkeys) {
            eraseTree(key);
        } else {
            entries_.erase(key);
        }
        return succeed(handle);
    }

    bool MemoryBackend::Rename(Handle handle, const std::string &key, const std::string &new_key,
                               const std::string &parent_key, bool check_parent_attrs,
                               const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *source = findLive(key);
        if (!source) {
            return fail(handle, ResponseSubcode::NoData);
        }
        if (!PassMatches(source->pass, pass)) {
            return fail(handle, ResponseSubcode::BadPassword);
        }
        if (!parent_key.empty()) {
            Entry *parent = findLive(parent_key);
            if (!parent || std::find(parent->subkeys.begin(), parent->subkeys.end(), key) == parent->subkeys.end()) {
                return fail(handle, ResponseSubcode::ParentMismatch);
            }
            if (check_parent_attrs && !PassMatches(parent->pass, pass)) {
                return fail(handle, ResponseSubcode::BadPassword);
            }
        }

        Entry moved = *source;
        if (ttl.count() > 0) {
            moved.expire = deadlineOf(ttl);
        }
        moved.mtime = now();
        entries_.erase(key);
        entries_[new_key] = std::move(moved);

        if (!parent_key.empty()) {
            auto parent_it = entries_.find(parent_key);
            if (parent_it != entries_.end()) {
                auto &list = parent_it->second.subkeys;
                std::replace(list.begin(), list.end(), key, new_key);
                parent_it->second.mtime = now();
            }
        }
        return succeed(handle);
    }

    std::optional<StringList> MemoryBackend::GetSubkeys(Handle handle, const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        Entry *entry = findLive(key);
        if (!entry || entry->subkeys.empty()) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }
        succeed(handle);
        return entry->subkeys;
    }

    bool MemoryBackend::SetSubkeys(Handle handle, const std::string &key, const StringList &subkeys) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            entry = &entries_[key];
        }
        entry->subkeys = subkeys;
        entry->mtime = now();
        return succeed(handle);
    }

    bool MemoryBackend::RemoveSubkey(Handle handle, const std::string &key, const std::string &subkey, bool recursive) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            return fail(handle, ResponseSubcode::NoData);
        }
        auto it = std::find(entry->subkeys.begin(), entry->subkeys.end(), subkey);
        if (it == entry->subkeys.end()) {
            return fail(handle, ResponseSubcode::NoData);
        }
        entry->subkeys.erase(it);
        entry->mtime = now();
        if (recursive) {
            eraseChildren(key, {subkey});
        }
        return succeed(handle);
    }

    bool MemoryBackend::ClearSubkeys(Handle handle, const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            return fail(handle, ResponseSubcode::NoData);
        }
        StringList children = std::move(entry->subkeys);
        entry->subkeys.clear();
        entry->mtime = now();
        eraseChildren(key, children);
        return succeed(handle);
    }

    std::optional<StringMap> MemoryBackend::GetAttrs(Handle handle, const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }

        StringMap attrs;
        if (entry->expire) {
            attrs["expire"] = std::to_string(Clock::to_time_t(*entry->expire));
        }
        if (!entry->pass.empty()) {
            attrs["encrypt"] = "on";
        }
        if (options_.track_mtime) {
            attrs["mtime"] = std::to_string(Clock::to_time_t(entry->mtime));
        }
        if (attrs.empty()) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }
        succeed(handle);
        return attrs;
    }

    bool MemoryBackend::CasInit(Handle handle, const std::string &key, const Bytes &value,
                                const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        const size_t width = value.size();
        if (width != 1 && width != 2 && width != 4 && width != 8) {
            return fail(handle, ResponseSubcode::InvalidArgument);
        }
        writeEntry(key, std::string(value.begin(), value.end()), pass, ttl, width);
        return succeed(handle);
    }

    std::optional<Bytes> MemoryBackend::CasGet(Handle handle, const std::string &key, Codec::DataType type,
                                               const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }
        if (!PassMatches(entry->pass, pass)) {
            fail(handle, ResponseSubcode::BadPassword);
            return std::nullopt;
        }
        if (entry->cas_width == 0 || entry->cas_width != Codec::Width(type)) {
            fail(handle, ResponseSubcode::TypeMismatch);
            return std::nullopt;
        }
        succeed(handle);
        return Bytes(entry->value.begin(), entry->value.end());
    }

    bool MemoryBackend::CasSet(Handle handle, const std::string &key, const Bytes &old_value, const Bytes &new_value,
                               const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            return fail(handle, ResponseSubcode::NoData);
        }
        if (!PassMatches(entry->pass, pass)) {
            return fail(handle, ResponseSubcode::BadPassword);
        }
        if (entry->cas_width == 0 || old_value.size() != entry->cas_width || new_value.size() != entry->cas_width) {
            return fail(handle, ResponseSubcode::TypeMismatch);
        }
        if (Bytes(entry->value.begin(), entry->value.end()) != old_value) {
            return fail(handle, ResponseSubcode::CasMismatch);
        }
        entry->value.assign(new_value.begin(), new_value.end());
        if (ttl.count() > 0) {
            entry->expire = deadlineOf(ttl);
        }
        entry->mtime = now();
        return succeed(handle);
    }

    bool MemoryBackend::CasIncDec(Handle handle, const std::string &key, bool increment,
                                  const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        Entry *entry = findLive(key);
        if (!entry) {
            return fail(handle, ResponseSubcode::NoData);
        }
        if (!PassMatches(entry->pass, pass)) {
            return fail(handle, ResponseSubcode::BadPassword);
        }
        if (entry->cas_width == 0) {
            return fail(handle, ResponseSubcode::TypeMismatch);
        }

        // 按单元宽度回绕
        u64 current = Codec::ToUnsigned(Bytes(entry->value.begin(), entry->value.end()));
        current = increment ? current + 1 : current - 1;
        Bytes next = Codec::FromUnsigned(current, Codec::DataTypeForWidth(entry->cas_width));
        entry->value.assign(next.begin(), next.end());
        if (ttl.count() > 0) {
            entry->expire = deadlineOf(ttl);
        }
        entry->mtime = now();
        return succeed(handle);
    }

    bool MemoryBackend::QueuePush(Handle handle, const std::string &prefix, const std::string &value,
                                  const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        queues_[prefix].push_back(QueueItem{"", value, pass, deadlineOf(ttl)});
        return succeed(handle);
    }

    // fifo 从队头取，否则从队尾取；取出前先丢弃该端已过期的元素
    std::optional<MemoryBackend::QueueItem> MemoryBackend::popItem(Handle handle,
                                                                   std::unordered_map<std::string, Queue> &queues,
                                                                   const std::string &prefix, bool fifo,
                                                                   const std::string &pass) {
        auto it = queues.find(prefix);
        if (it == queues.end()) {
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }
        Queue &queue = it->second;
        while (!queue.empty()) {
            const QueueItem &edge = fifo ? queue.front() : queue.back();
            if (!isExpired(edge.expire)) {
                break;
            }
            dropQueuedEntry(edge);
            if (fifo) {
                queue.pop_front();
            } else {
                queue.pop_back();
            }
        }
        if (queue.empty()) {
            queues.erase(it);
            fail(handle, ResponseSubcode::NoData);
            return std::nullopt;
        }

        QueueItem &edge = fifo ? queue.front() : queue.back();
        if (!PassMatches(edge.pass, pass)) {
            fail(handle, ResponseSubcode::BadPassword);
            return std::nullopt;
        }
        QueueItem item = std::move(edge);
        if (fifo) {
            queue.pop_front();
        } else {
            queue.pop_back();
        }
        if (queue.empty()) {
            queues.erase(it);
        }
        succeed(handle);
        return item;
    }

    // 至少删除一个元素即视为成功；中途遇到口令不匹配立即失败
    bool MemoryBackend::removeItems(Handle handle, std::unordered_map<std::string, Queue> &queues,
                                    const std::string &prefix, size_t count, bool fifo, const std::string &pass,
                                    bool drop_entries) {
        size_t removed = 0;
        for (; removed < count; ++removed) {
            auto item = popItem(handle, queues, prefix, fifo, pass);
            if (!item) {
                break;
            }
            if (drop_entries) {
                dropQueuedEntry(*item);
            }
        }
        if (removed == count) {
            return succeed(handle);
        }
        if (removed > 0 && handles_[handle].subcode == ResponseSubcode::NoData) {
            return succeed(handle);
        }
        return false;
    }

    std::optional<std::string> MemoryBackend::QueuePop(Handle handle, const std::string &prefix, bool fifo,
                                                       const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        auto item = popItem(handle, queues_, prefix, fifo, pass);
        if (!item) {
            return std::nullopt;
        }
        return item->value;
    }

    bool MemoryBackend::QueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                                    const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        return removeItems(handle, queues_, prefix, count, fifo, pass, false);
    }

    bool MemoryBackend::KeyQueuePush(Handle handle, const std::string &prefix, const std::string &key,
                                     const std::string &value, const std::string &pass, std::chrono::seconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        key_queues_[prefix].push_back(QueueItem{key, value, pass, deadlineOf(ttl)});
        writeEntry(key, value, pass, ttl, 0);
        return succeed(handle);
    }

    std::optional<std::pair<std::string, std::string>> MemoryBackend::KeyQueuePop(Handle handle,
                                                                                 const std::string &prefix,
                                                                                 bool fifo, const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return std::nullopt;
        }
        auto item = popItem(handle, key_queues_, prefix, fifo, pass);
        if (!item) {
            return std::nullopt;
        }
        dropQueuedEntry(*item);
        return std::make_pair(item->key, item->value);
    }

    bool MemoryBackend::KeyQueueRemove(Handle handle, const std::string &prefix, size_t count, bool fifo,
                                       const std::string &pass) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!checkHandle(handle)) {
            return false;
        }
        return removeItems(handle, key_queues_, prefix, count, fifo, pass, true);
    }

    ResponseCode MemoryBackend::GetResponseCode(Handle handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (KDC_UNLIKELY(it == handles_.end())) {
            return ResponseCode::Error;
        }
        return it->second.code;
    }

    ResponseSubcode MemoryBackend::GetResponseSubcode(Handle handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (KDC_UNLIKELY(it == handles_.end())) {
            return ResponseSubcode::InvalidHandle;
        }
        return it->second.subcode;
    }

    bool MemoryBackend::SetDebugFile(NativeLayer layer, const std::string &path) {
        if (path.empty()) {
            return false;
        }
        std::ofstream out(path, std::ios::app);
        if (!out.is_open()) {
            KDC_LOG_ERROR("Cannot open native debug file {} for layer {}", path, ToString(layer));
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        debug_files_[layer] = path;
        return true;
    }

    bool MemoryBackend::UnsetDebugFile(NativeLayer layer) {
        std::lock_guard<std::mutex> lock(mutex_);
        debug_files_.erase(layer);
        return true;
    }

    void MemoryBackend::SetDebugLevel(NativeLayer layer, NativeLogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        debug_levels_[layer] = level;
    }

    void MemoryBackend::SetComLog(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        comlog_enabled_ = enable;
    }

    NativeLogLevel MemoryBackend::GetDebugLevel(NativeLayer layer) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = debug_levels_.find(layer);
        return it != debug_levels_.end() ? it->second : NativeLogLevel::Silent;
    }

    std::optional<std::string> MemoryBackend::GetDebugFile(NativeLayer layer) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = debug_files_.find(layer);
        if (it == debug_files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool MemoryBackend::IsComLogEnabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return comlog_enabled_;
    }

    size_t MemoryBackend::OpenHandleCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_.size();
    }

    void MemoryBackend::Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        queues_.clear();
        key_queues_.clear();
    }

}// namespace Kdc
