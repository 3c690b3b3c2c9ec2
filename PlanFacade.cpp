#include "PlanFacade.h"

#include <QDebug>
#include <exception>
#include <iostream>

QString PlanFacade::fail_(const dist::Error& e) {
    const QString msg = QString::fromStdString(e.describe());
    qCritical().noquote() << msg;
    emit errorOccurred(msg);
    return msg;
}

void PlanFacade::setReady_(bool ready) {
    if (ready_ == ready) return;
    ready_ = ready;
    emit readyChanged();
}

QString PlanFacade::loadProject(const QString& path) {
    setReady_(false);
    distMgr_.reset();
    connMgr_.reset();
    project_.reset();

    dist::ProjectParser parser;
    auto res = parser.parseFile(path.toStdString());
    if (!res)
        return fail_(dist::withContext("loadProject", res.error()));

    project_ = std::make_unique<dist::ProjectInput>(std::move(res.value()));
    qInfo().noquote() << "Project" << QString::fromStdString(project_->name)
                      << "loaded:" << project_->groups.size() << "meter groups";
    return {};
}

QString PlanFacade::loadSample() {
    setReady_(false);
    distMgr_.reset();
    connMgr_.reset();
    project_.reset();

    auto res = dist::ProjectParser::sampleProject();
    if (!res)
        return fail_(dist::withContext("loadSample", res.error()));

    project_ = std::make_unique<dist::ProjectInput>(std::move(res.value()));
    qInfo().noquote() << "Sample project loaded:" << project_->groups.size() << "meter groups";
    return {};
}

QString PlanFacade::calculate() {
    try {
        if (!project_)
            return fail_(dist::Error{dist::ErrorCode::LogicError, "calculate: no project loaded"});

        setReady_(false);
        dist::BalancingConfig cfg = project_->config;
        if (consolidation_ >= 0)
            cfg.enableConsolidation = consolidation_ > 0;

        distMgr_ = std::make_unique<dist::DistManager>(cfg, project_->catalog);
        auto st = distMgr_->run(project_->groups);
        if (!st) {
            distMgr_.reset();
            return fail_(dist::withContext("calculate", st.error()));
        }

        const auto& r = distMgr_->results();
        for (const auto& d : r.diagnostics)
            qWarning().noquote() << dist::toString(d.code) << QString::fromStdString(d.location)
                                 << QString::fromStdString(d.message);

        connMgr_ = std::make_unique<conn::ConnManager>();
        st = connMgr_->build(r.transformers);
        if (!st) {
            connMgr_.reset();
            return fail_(dist::withContext("calculate", st.error()));
        }

        qInfo().noquote() << "Distribution:" << r.summary.totalTransformers << "transformers,"
                          << r.summary.totalBreakers << "breakers,"
                          << connMgr_->connections().size() << "connections";
        setReady_(true);
        return {};
    } catch (const std::exception& e) {
        distMgr_.reset();
        connMgr_.reset();
        const QString msg = QString("Exception: ") + e.what();
        qCritical().noquote() << msg;
        emit errorOccurred(msg);
        return msg;
    }
}

void PlanFacade::setConsolidation(bool enabled) {
    consolidation_ = enabled ? 1 : 0;
}

void PlanFacade::reset() {
    connMgr_.reset();
    distMgr_.reset();
    project_.reset();
    consolidation_ = -1;
    setReady_(false);
}

QString PlanFacade::resultsJson(bool pretty) const {
    if (!distMgr_ || !distMgr_->hasResults())
        return QStringLiteral("{\"transformers\":[]}");
    return QString::fromStdString(distMgr_->toJson(pretty ? 2 : -1));
}

QString PlanFacade::connectionsJson(bool pretty) const {
    if (!connMgr_ || !connMgr_->isBuilt())
        return QStringLiteral("{\"connections\":[]}");
    return QString::fromStdString(connMgr_->toJson(pretty ? 2 : -1));
}

QString PlanFacade::planJson(bool pretty) const {
    const QString sep = pretty ? QStringLiteral("\n") : QString();
    return QStringLiteral("{\"results\":%1,%2\"connections\":%3}")
        .arg(resultsJson(pretty), sep, connectionsJson(pretty));
}

void PlanFacade::printReport() const {
    if (!ready_) {
        std::cout << "No plan computed\n";
        return;
    }
    std::cout << "\n\n TRANSFORMERS : \n\n";
    auto st = distMgr_->printTransformers();
    if (st) st = distMgr_->printSummary();
    if (st) st = distMgr_->printDiagnostics();
    std::cout << "\n\n CONNECTIONS : \n\n";
    if (st) st = connMgr_->printConnections();
    if (st) st = connMgr_->printTotals();
    if (!st)
        qWarning().noquote() << QString::fromStdString(st.error().describe());
}
