#include "core/session/transactional_store.hpp"

#include "common/logger.hpp"

#include <utility>

namespace collab {
namespace core {

using common::Status;
using common::StatusCode;
using common::StatusOr;

namespace {

// 存储故障最终以 ServiceUnavailable 返回给调用方, 统一在这里记 error
Status ReportStoreFailure(const char* op, const std::string& chat_id, Status status) {
    if (status.Code() == StatusCode::kInternal || status.Code() == StatusCode::kUnavailable) {
        COLLAB_LOG_ERROR("[Store] {} on chat {} failed: {}", op, chat_id, status.Message());
    }
    return status;
}

} // namespace

const char* StoreModeToString(StoreMode mode) {
    return mode == StoreMode::kAtomic ? "atomic" : "optimistic";
}

AtomicTransaction::AtomicTransaction(std::shared_ptr<RecordStore> backend)
    : backend_(std::move(backend)) {}

Status AtomicTransaction::Execute(const std::string& chat_id, const char* op, const Work& work) {
    auto txn_result = backend_->BeginTransaction(chat_id);
    if (!txn_result.IsOk()) {
        COLLAB_LOG_ERROR("[Store] {} begin transaction failed for chat {}: {}",
                         op, chat_id, txn_result.GetStatus().Message());
        return txn_result.GetStatus();
    }
    auto txn = std::move(txn_result).Value();
    auto status = work(*txn);
    if (!status.IsOk()) {
        // txn 析构时回滚
        return ReportStoreFailure(op, chat_id, std::move(status));
    }
    auto commit = txn->Commit();
    if (!commit.IsOk()) {
        COLLAB_LOG_ERROR("[Store] {} commit failed for chat {}: {}", op, chat_id, commit.Message());
    }
    return commit;
}

Status AtomicTransaction::Direct(const Work& work) {
    auto txn_result = backend_->OpenAutoCommit();
    if (!txn_result.IsOk()) {
        return ReportStoreFailure("direct", "-", txn_result.GetStatus());
    }
    auto txn = std::move(txn_result).Value();
    return ReportStoreFailure("direct", "-", work(*txn));
}

OptimisticRetry::OptimisticRetry(std::shared_ptr<RecordStore> backend)
    : backend_(std::move(backend)) {}

Status OptimisticRetry::Execute(const std::string& chat_id, const char* op, const Work& work) {
    for (int attempt = 1; attempt <= 2; ++attempt) {
        auto txn_result = backend_->OpenAutoCommit();
        if (!txn_result.IsOk()) {
            return ReportStoreFailure(op, chat_id, txn_result.GetStatus());
        }
        auto txn = std::move(txn_result).Value();
        auto status = work(*txn);
        if (status.Code() != StatusCode::kAborted) {
            return ReportStoreFailure(op, chat_id, std::move(status));
        }
        if (attempt == 1) {
            COLLAB_LOG_WARN("[Store] {} on chat {} hit concurrent update, retrying once: {}",
                            op, chat_id, status.Message());
            continue;
        }
        COLLAB_LOG_WARN("[Store] {} on chat {} conflicted twice: {}", op, chat_id, status.Message());
    }
    return Status::Aborted("concurrent update on chat, please retry");
}

Status OptimisticRetry::Direct(const Work& work) {
    auto txn_result = backend_->OpenAutoCommit();
    if (!txn_result.IsOk()) {
        return ReportStoreFailure("direct", "-", txn_result.GetStatus());
    }
    auto txn = std::move(txn_result).Value();
    return ReportStoreFailure("direct", "-", work(*txn));
}

StatusOr<std::shared_ptr<TransactionalStore>> SelectTransactionalStore(
    std::shared_ptr<RecordStore> backend, const std::string& mode) {
    if (!backend) {
        return Status::InvalidArgument("record store is null");
    }
    if (mode != "auto" && mode != "atomic" && mode != "optimistic") {
        return Status::InvalidArgument("unknown storage mode: " + mode);
    }
    std::shared_ptr<TransactionalStore> store;
    if (mode == "optimistic") {
        store = std::make_shared<OptimisticRetry>(std::move(backend));
    } else {
        auto detected = backend->DetectTransactionSupport();
        if (!detected.IsOk()) {
            COLLAB_LOG_ERROR("[Store] transaction capability detection failed: {}", detected.GetStatus().Message());
            return detected.GetStatus();
        }
        if (detected.Value()) {
            store = std::make_shared<AtomicTransaction>(std::move(backend));
        } else if (mode == "atomic") {
            return Status::FailedPrecondition("storage backend does not support transactions");
        } else {
            store = std::make_shared<OptimisticRetry>(std::move(backend));
        }
    }
    COLLAB_LOG_INFO("[Store] using {} write strategy (configured: {})", StoreModeToString(store->Mode()), mode);
    return StatusOr<std::shared_ptr<TransactionalStore>>(std::move(store));
}

} // namespace core
} // namespace collab
