#pragma once
#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

// Something that can take part in an all-or-nothing operation.
class ITransactional {
public:
    virtual ~ITransactional() = default;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// One engine operation. Participants are opened on construction. Leaving the
// scope without commit() runs the local undo actions newest-first and rolls
// every participant back.
class OperationScope {
public:
    explicit OperationScope(std::initializer_list<ITransactional*> participants) {
        participants_.reserve(participants.size());
        try {
            for (auto* p : participants) {
                if (!p) continue;
                p->begin();
                participants_.push_back(p);
            }
        } catch (...) {
            for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
                (*it)->rollback();
            }
            throw;
        }
    }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

    ~OperationScope() {
        if (committed_) return;
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            (*it)();
        }
        for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
            (*it)->rollback();
        }
    }

    void on_rollback(std::function<void()> undo) { undo_.push_back(std::move(undo)); }

    void commit() {
        committed_ = true;
        for (auto* p : participants_) {
            p->commit();
        }
    }

private:
    std::vector<ITransactional*> participants_;
    std::vector<std::function<void()>> undo_;
    bool committed_{false};
};
