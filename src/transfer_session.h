#pragma once
#include <QObject>
#include <QString>

#include "transfer_engine.h"
#include "transfer_error.h"
#include "transfer_settings.h"

class UiPrompts;

/**
 * TransferSession - one copy run from folder selection to cleanup
 *
 * Idle -> Scanning -> Copying -> ConfirmDelete -> Deleting -> Pruning -> Done.
 * Validation failures end in Failed; an empty scan or a declined prompt ends in
 * Done early. Prompts are asked on the calling thread between phases; the copy
 * and delete phases block until every worker has finished.
 */
class TransferSession : public QObject {
    Q_OBJECT
public:
    enum class Phase { Idle, Scanning, Copying, ConfirmDelete, Deleting, Pruning, Done, Failed };
    Q_ENUM(Phase)

    struct Result {
        Phase finalPhase = Phase::Idle;
        TransferError error;            // set when finalPhase == Failed
        QString source;                 // canonical roots once validated
        QString destination;
        int discovered = 0;
        qint64 totalBytes = 0;
        bool copyConfirmed = false;
        bool deleteConfirmed = false;
        TransferSummary copy;
        TransferSummary removal;
    };

    TransferSession(UiPrompts& prompts, const TransferSettings& settings, QObject* parent = nullptr);

    Result run();
    Phase phase() const { return m_phase; }

    static QString phaseName(Phase phase);

signals:
    void phaseChanged(TransferSession::Phase phase);

private:
    void setPhase(Phase phase);
    Result finish(Result& result, Phase phase);
    Result fail(Result& result, const TransferError& error);

    UiPrompts& m_prompts;
    TransferSettings m_settings;
    TransferEngine m_engine;
    Phase m_phase = Phase::Idle;
};
