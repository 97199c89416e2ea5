#include "session.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace synapse::transfer
{
std::string to_string(SessionStatus::Status status)
{
    switch (status)
    {
        case SessionStatus::Status::IDLE: return "idle";
        case SessionStatus::Status::DOWNLOADING: return "downloading";
        case SessionStatus::Status::SEEDING: return "seeding";
        case SessionStatus::Status::PAUSED: return "paused";
        case SessionStatus::Status::ERROR: return "error";
    }
    return "unknown";
}

Session::Session(std::string content_hash, std::string file_path, unsigned long long total_size,
    Status initial_status)
    : content_hash_ {std::move(content_hash)}
    , file_path_ {std::move(file_path)}
    , total_size_ {total_size}
    , downloaded_ {0}
    , uploaded_ {0}
    , status_ {initial_status}
    , started_at_ {Clock::now()}
{}

std::shared_ptr<Session> Session::create_for_seed(
    std::string content_hash, std::string file_path, unsigned long long total_size)
{
    auto session = std::make_shared<Session>(
        std::move(content_hash), std::move(file_path), total_size, Status::SEEDING);
    // The artifact is already complete locally
    session->downloaded_   = total_size;
    session->completed_at_ = session->started_at_;
    return session;
}

std::shared_ptr<Session> Session::create_for_download(
    std::string content_hash, std::string file_path, unsigned long long total_size)
{
    return std::make_shared<Session>(
        std::move(content_hash), std::move(file_path), total_size, Status::DOWNLOADING);
}

const std::string &Session::content_hash() const
{
    return content_hash_;
}

const std::string &Session::file_path() const
{
    return file_path_;
}

unsigned long long Session::total_size() const
{
    return total_size_;
}

unsigned long long Session::downloaded() const
{
    std::lock_guard lock {mutex_};
    return downloaded_;
}

unsigned long long Session::uploaded() const
{
    std::lock_guard lock {mutex_};
    return uploaded_;
}

Session::Status Session::status() const
{
    std::lock_guard lock {mutex_};
    return status_;
}

bool Session::is_active() const
{
    std::lock_guard lock {mutex_};
    return is_active_internal();
}

double Session::progress() const
{
    std::lock_guard lock {mutex_};
    return progress_internal();
}

double Session::share_ratio() const
{
    std::lock_guard lock {mutex_};
    return share_ratio_internal();
}

bool Session::is_complete() const
{
    std::lock_guard lock {mutex_};
    return downloaded_ >= total_size_ && status_ == Status::SEEDING;
}

std::optional<std::string> Session::error_message() const
{
    std::lock_guard lock {mutex_};
    return error_message_;
}

std::vector<model::Peer> Session::peers() const
{
    std::lock_guard lock {mutex_};
    return peers_;
}

const utils::CompletionToken &Session::completion_token() const
{
    return completion_token_;
}

SessionStatus Session::snapshot() const
{
    std::lock_guard lock {mutex_};

    SessionStatus s;
    s.content_hash = content_hash_;
    s.file_path    = file_path_;
    s.status       = status_;
    s.progress     = progress_internal();
    s.peer_count   = peers_.size();
    s.total_size   = total_size_;
    s.uploaded     = uploaded_;
    s.downloaded   = downloaded_;
    s.share_ratio  = share_ratio_internal();
    s.started_at   = started_at_;
    s.completed_at = completed_at_;
    s.error        = error_message_;
    return s;
}

bool Session::add_downloaded(unsigned long long bytes)
{
    std::lock_guard lock {mutex_};

    if (status_ != Status::DOWNLOADING)
    {
        return false;
    }

    downloaded_ = std::min(total_size_, downloaded_ + bytes);
    return true;
}

bool Session::add_uploaded(unsigned long long bytes)
{
    std::lock_guard lock {mutex_};

    if (!is_active_internal())
    {
        return false;
    }

    uploaded_ += bytes;
    return true;
}

void Session::set_peers(std::vector<model::Peer> peers)
{
    std::lock_guard lock {mutex_};
    peers_ = std::move(peers);
}

bool Session::complete()
{
    std::lock_guard lock {mutex_};

    if (status_ != Status::DOWNLOADING || downloaded_ < total_size_)
    {
        return false;
    }

    status_       = Status::SEEDING;
    completed_at_ = Clock::now();
    return true;
}

bool Session::fail(std::string message)
{
    std::lock_guard lock {mutex_};

    if (status_ == Status::PAUSED || status_ == Status::ERROR)
    {
        return false;
    }

    LOG(ERROR) << "Session " << content_hash_ << " failed: " << message;
    status_        = Status::ERROR;
    error_message_ = std::move(message);
    completion_token_.cancel();
    return true;
}

bool Session::pause()
{
    std::lock_guard lock {mutex_};

    if (!is_active_internal())
    {
        return false;
    }

    status_ = Status::PAUSED;
    completion_token_.cancel();
    return true;
}

bool Session::is_active_internal() const
{
    return status_ == Status::DOWNLOADING || status_ == Status::SEEDING;
}

double Session::progress_internal() const
{
    if (total_size_ == 0)
    {
        return 0.0;
    }
    return double(downloaded_) / double(total_size_) * 100.0;
}

double Session::share_ratio_internal() const
{
    if (downloaded_ == 0)
    {
        return 0.0;
    }
    return double(uploaded_) / double(downloaded_);
}
}  // namespace synapse::transfer
