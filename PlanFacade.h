#pragma once

#include <QObject>
#include <QString>
#include <memory>

#include "DistManager.h"    // distLib
#include "ProjectParser.h"  // distLib
#include "ConnManager.h"    // connLib

class PlanFacade : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool ready READ isReady NOTIFY readyChanged)
public:
    explicit PlanFacade(QObject* parent = nullptr)
        : QObject(parent) {}

    // Charge un projet XML. Retourne "" si OK, sinon un message d'erreur.
    Q_INVOKABLE QString loadProject(const QString& path);

    // Projet d'exemple intégré (6 groupes)
    Q_INVOKABLE QString loadSample();

    // Équilibrage + raccordements sur le projet chargé. "" si OK.
    Q_INVOKABLE QString calculate();

    // Force la passe de regroupement (prioritaire sur <Settings consolidate>)
    Q_INVOKABLE void setConsolidation(bool enabled);

    Q_INVOKABLE void reset();

    bool isReady() const { return ready_; }

    // Exports JSON
    Q_INVOKABLE QString resultsJson(bool pretty = false) const;
    Q_INVOKABLE QString connectionsJson(bool pretty = false) const;
    Q_INVOKABLE QString planJson(bool pretty = false) const;   // {"results":..,"connections":..}

    // Rapport texte sur stdout (debug)
    void printReport() const;

signals:
    void readyChanged();
    void errorOccurred(const QString& message);

private:
    QString fail_(const dist::Error& e);
    void setReady_(bool ready);

    bool ready_ = false;
    int consolidation_ = -1;   // -1: réglage du projet
    std::unique_ptr<dist::ProjectInput> project_;
    std::unique_ptr<dist::DistManager> distMgr_;
    std::unique_ptr<conn::ConnManager> connMgr_;
};
