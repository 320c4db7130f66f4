/**
 * @file history_manager.cpp
 * @brief Undo/redo history implementation
 */

#include <splice/model/commands/history_manager.hpp>

#include <splice/core/invariant.hpp>
#include <splice/core/logger.hpp>

namespace spl::model {

HistoryManager::HistoryManager(Timeline& timeline, size_t undoLimit)
    : m_timeline(timeline)
    , m_undoLimit(undoLimit) {
}

// ============================================================================
// Command Execution
// ============================================================================

Result<void> HistoryManager::execute(const EditCommand& command, std::string description) {
    auto applied = applyCommand(m_timeline, command);
    if (!applied) {
        LOG_DEBUG("Command rejected: {}", applied.error().what());
        return Err<void>(applied.error());
    }

    if (m_transaction) {
        m_transaction->commands.push_back(std::move(applied.value().forward));
        m_transaction->inverses.push_back(std::move(applied.value().inverse));
        return Ok();
    }

    HistoryEntry entry;
    entry.description = description.empty() ? describeCommand(command) : std::move(description);
    entry.commands.push_back(std::move(applied.value().forward));
    entry.inverses.push_back(std::move(applied.value().inverse));
    push(std::move(entry));
    return Ok();
}

Result<void> HistoryManager::executeBatch(std::string description,
                                          const std::vector<EditCommand>& commands) {
    if (commands.empty()) {
        return Ok();
    }

    std::vector<EditCommand> forwards;
    std::vector<EditCommand> inverses;
    auto result = applyAll(commands, &forwards, &inverses);
    if (!result) {
        LOG_DEBUG("Batch '{}' rejected: {}", description, result.error().what());
        return result;
    }

    if (m_transaction) {
        for (auto& c : forwards) m_transaction->commands.push_back(std::move(c));
        for (auto& c : inverses) m_transaction->inverses.push_back(std::move(c));
        return Ok();
    }

    push(HistoryEntry{std::move(description), std::move(forwards), std::move(inverses)});
    return Ok();
}

// ============================================================================
// Undo/Redo
// ============================================================================

bool HistoryManager::undo() {
    if (inTransaction() || !canUndo()) return false;

    const HistoryEntry& entry = m_entries[m_index - 1];
    std::vector<EditCommand> reversed(entry.inverses.rbegin(), entry.inverses.rend());

    auto result = applyAll(reversed, nullptr, nullptr);
    if (!result) {
        SPLICE_INVARIANT(false, "undo entry no longer applies");
        LOG_ERROR("Undo of '{}' failed: {}", entry.description, result.error().what());
        return false;
    }

    bool wasClean = isClean();
    --m_index;
    notify(wasClean);
    return true;
}

bool HistoryManager::redo() {
    if (inTransaction() || !canRedo()) return false;

    const HistoryEntry& entry = m_entries[m_index];
    auto result = applyAll(entry.commands, nullptr, nullptr);
    if (!result) {
        SPLICE_INVARIANT(false, "redo entry no longer applies");
        LOG_ERROR("Redo of '{}' failed: {}", entry.description, result.error().what());
        return false;
    }

    bool wasClean = isClean();
    ++m_index;
    notify(wasClean);
    return true;
}

bool HistoryManager::canUndo() const {
    return m_index > 0;
}

bool HistoryManager::canRedo() const {
    return m_index < m_entries.size();
}

std::string HistoryManager::undoText() const {
    if (!canUndo()) return "";
    return m_entries[m_index - 1].description;
}

std::string HistoryManager::redoText() const {
    if (!canRedo()) return "";
    return m_entries[m_index].description;
}

// ============================================================================
// Transactions
// ============================================================================

void HistoryManager::beginTransaction(std::string description) {
    if (m_transactionDepth == 0) {
        m_transaction = Transaction{std::move(description), {}, {}};
    }
    ++m_transactionDepth;
}

Result<void> HistoryManager::commitTransaction() {
    if (m_transactionDepth == 0) {
        return Err<void>(ErrorCode::InvalidState, "No open transaction");
    }

    if (--m_transactionDepth > 0) {
        return Ok();
    }

    Transaction tx = std::move(*m_transaction);
    m_transaction.reset();

    if (tx.commands.empty()) {
        return Ok();
    }

    push(HistoryEntry{std::move(tx.description), std::move(tx.commands), std::move(tx.inverses)});
    return Ok();
}

Result<void> HistoryManager::abortTransaction() {
    if (m_transactionDepth == 0) {
        return Err<void>(ErrorCode::InvalidState, "No open transaction");
    }

    Transaction tx = std::move(*m_transaction);
    m_transaction.reset();
    m_transactionDepth = 0;

    if (!rollback(tx.inverses)) {
        return Err<void>(ErrorCode::InvariantViolation,
                         "Transaction '" + tx.description + "' could not be rolled back");
    }
    LOG_DEBUG("Transaction '{}' aborted ({} edits reverted)", tx.description, tx.inverses.size());
    return Ok();
}

// ============================================================================
// Stack Management
// ============================================================================

void HistoryManager::clear() {
    bool wasClean = isClean();
    m_entries.clear();
    m_index = 0;
    m_cleanIndex = size_t{0};
    notify(wasClean);
}

void HistoryManager::setClean() {
    bool wasClean = isClean();
    m_cleanIndex = m_index;
    if (!wasClean) {
        cleanChanged.fire(true);
    }
}

bool HistoryManager::isClean() const {
    return m_cleanIndex && *m_cleanIndex == m_index;
}

void HistoryManager::setUndoLimit(size_t limit) {
    bool wasClean = isClean();
    size_t before = m_entries.size();
    m_undoLimit = limit;
    enforceLimit();
    if (m_entries.size() != before) {
        notify(wasClean);
    }
}

// ============================================================================
// Internals
// ============================================================================

void HistoryManager::push(HistoryEntry entry) {
    bool wasClean = isClean();

    // A new edit discards the redo tail
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(m_index), m_entries.end());
    if (m_cleanIndex && *m_cleanIndex > m_index) {
        m_cleanIndex.reset();
    }

    LOG_TRACE("History push '{}' ({} commands)", entry.description, entry.commands.size());
    m_entries.push_back(std::move(entry));
    ++m_index;

    enforceLimit();
    notify(wasClean);
}

void HistoryManager::enforceLimit() {
    while (m_undoLimit > 0 && m_index > m_undoLimit) {
        m_entries.erase(m_entries.begin());
        --m_index;
        if (m_cleanIndex) {
            if (*m_cleanIndex == 0) {
                m_cleanIndex.reset();
            } else {
                --*m_cleanIndex;
            }
        }
    }
}

Result<void> HistoryManager::applyAll(const std::vector<EditCommand>& commands,
                                      std::vector<EditCommand>* forwards,
                                      std::vector<EditCommand>* inverses) {
    std::vector<EditCommand> applied;
    applied.reserve(commands.size());

    for (const auto& command : commands) {
        auto result = applyCommand(m_timeline, command);
        if (!result) {
            rollback(applied);
            return Err<void>(result.error());
        }
        if (forwards) forwards->push_back(result.value().forward);
        applied.push_back(std::move(result.value().inverse));
    }

    if (inverses) *inverses = std::move(applied);
    return Ok();
}

bool HistoryManager::rollback(const std::vector<EditCommand>& inverses) {
    bool ok = true;
    for (auto it = inverses.rbegin(); it != inverses.rend(); ++it) {
        auto result = applyCommand(m_timeline, *it);
        if (!result) {
            ok = SPLICE_INVARIANT(false, "inverse command failed during rollback");
            LOG_ERROR("Rollback step failed: {}", result.error().what());
        }
    }
    return ok;
}

void HistoryManager::notify(bool wasClean) {
    indexChanged.fire();
    bool clean = isClean();
    if (clean != wasClean) {
        cleanChanged.fire(clean);
    }
}

} // namespace spl::model
