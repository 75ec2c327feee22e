#include "core/instance.hpp"

#include <algorithm>
#include <utility>

#include "util/async_log.hpp"

namespace core {

Instance::Instance(std::string tenant, chunk::ChunkFactory factory, const Limiter& limiter,
                   const IngesterConfig& cfg)
    : tenant_(std::move(tenant))
    , factory_(std::move(factory))
    , limiter_(limiter)
    , cfg_(cfg) {}

Status Instance::resolve(const CanonicalLabels& labels, std::shared_ptr<Stream>& out) {
    std::lock_guard<std::mutex> lock(mtx_);

    const auto it = streams_.find(labels.fingerprint);
    if (it != streams_.end()) {
        for (const auto& s : it->second) {
            if (s->labels() == labels.labels) {
                out = s;
                return Status::ok_status();
            }
        }
    }

    Status st = limiter_.assert_max_streams_per_user(tenant_, stream_count_);
    if (!st.ok()) {
        ++counters_.limit_rejections;
        LOG_INGEST_WARN("INST", tenant_, labels.fingerprint, "stream rejected: %s", st.message.c_str());
        return st;
    }

    auto stream = std::make_shared<Stream>(tenant_, labels, factory_, cfg_.out_of_order);
    Bucket& bucket = streams_[labels.fingerprint];
    if (!bucket.empty()) {
        ++counters_.fingerprint_collisions;
        LOG_INGEST_INFO("INST", tenant_, labels.fingerprint,
                        "fingerprint collision, bucket size %zu, strong %016llx vs %016llx", bucket.size() + 1,
                        static_cast<unsigned long long>(strong_fingerprint(labels.labels)),
                        static_cast<unsigned long long>(strong_fingerprint(bucket.front()->labels())));
    }
    bucket.push_back(stream);
    ++stream_count_;
    ++counters_.streams_created;
    LOG_INGEST_DEBUG("INST", tenant_, labels.fingerprint, "created stream %s", stream->labels_string().c_str());
    out = std::move(stream);
    return Status::ok_status();
}

Status Instance::get_or_create_stream(const CanonicalLabels& labels, Stream*& out) {
    std::shared_ptr<Stream> stream;
    Status st = resolve(labels, stream);
    if (st.ok()) {
        out = stream.get();
    }
    return st;
}

Status Instance::get_or_create_stream(std::string_view labels, Stream*& out) {
    CanonicalLabels canon;
    Status st = parse_labels(labels, canon);
    if (!st.ok()) {
        return st;
    }
    return get_or_create_stream(canon, out);
}

Status Instance::push(const Context& ctx, const PushRequest& req) {
    if (Status st = ctx.err(); !st.ok()) {
        return st;
    }

    Status first_error;
    for (std::size_t i = 0; i < req.streams.size(); ++i) {
        if (i > 0) {
            if (Status st = ctx.err(); !st.ok()) {
                if (first_error.ok()) {
                    first_error = std::move(st);
                }
                break;
            }
        }
        const StreamPush& group = req.streams[i];

        CanonicalLabels canon;
        Status st = parse_labels(group.labels, canon);
        std::shared_ptr<Stream> stream;
        if (st.ok()) {
            st = resolve(canon, stream);
        }
        if (st.ok()) {
            st = stream->append(group.entries, cfg_.sync_period_ns, cfg_.sync_min_utilization);
        }
        if (!st.ok() && first_error.ok()) {
            first_error = std::move(st);
        }
    }
    return first_error;
}

Stream* Instance::find_stream(std::string_view labels) const {
    CanonicalLabels canon;
    if (!parse_labels(labels, canon).ok()) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = streams_.find(canon.fingerprint);
    if (it == streams_.end()) {
        return nullptr;
    }
    for (const auto& s : it->second) {
        if (s->labels() == canon.labels) {
            return s.get();
        }
    }
    return nullptr;
}

void Instance::for_each_stream(const std::function<void(Stream&)>& fn) const {
    std::vector<std::shared_ptr<Stream>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snapshot.reserve(stream_count_);
        for (const auto& [fp, bucket] : streams_) {
            snapshot.insert(snapshot.end(), bucket.begin(), bucket.end());
        }
    }
    for (const auto& s : snapshot) {
        fn(*s);
    }
}

std::size_t Instance::collect_closed_chunks(std::vector<ClosedChunk>& out) const {
    std::size_t n = 0;
    for_each_stream([&](Stream& s) { n += s.collect_closed(out); });
    return n;
}

bool Instance::remove_stream(std::string_view labels) {
    CanonicalLabels canon;
    if (!parse_labels(labels, canon).ok()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = streams_.find(canon.fingerprint);
    if (it == streams_.end()) {
        return false;
    }
    Bucket& bucket = it->second;
    const auto pos = std::find_if(bucket.begin(), bucket.end(),
                                  [&](const auto& s) { return s->labels() == canon.labels; });
    if (pos == bucket.end()) {
        return false;
    }
    bucket.erase(pos);
    if (bucket.empty()) {
        streams_.erase(it);
    }
    --stream_count_;
    ++counters_.streams_removed;
    return true;
}

std::size_t Instance::stream_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stream_count_;
}

std::size_t Instance::bucket_size(Fingerprint fp) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = streams_.find(fp);
    return it == streams_.end() ? 0 : it->second.size();
}

InstanceCounters Instance::counters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_;
}

} // namespace core
