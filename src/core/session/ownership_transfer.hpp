#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "core/session/notifier.hpp"
#include "core/session/session_types.hpp"
#include "core/session/transactional_store.hpp"

#include <memory>
#include <string>

namespace collab {
namespace core {

struct TransferOwnershipCommand {
    Caller      caller;        // 当前 owner
    std::string chat_id;
    std::string new_owner_id;  // 必须是 accepted 参与者
};

// owner 转让: 新 owner 取得颜色 0, 原 owner 降为参与者并接过新 owner 原来的颜色
// 会话 owner_id 与两条参与者行在同一次变更中更新, owner_id 最后写入
class OwnershipTransfer {
public:
    using Status = common::Status;

    explicit OwnershipTransfer(std::shared_ptr<TransactionalStore> store,
                               std::shared_ptr<Notifier> notifier = nullptr,
                               std::shared_ptr<common::Clock> clock = nullptr);

    Status Transfer(const TransferOwnershipCommand& command);

private:
    static void Revert(StoreTxn& txn, const Participant& original, const Participant& written);

    std::shared_ptr<TransactionalStore> store_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<common::Clock> clock_;
};

} // namespace core
} // namespace collab
