#include "EngineController.hpp"
#include "kingcap/notation.hpp"

EngineController::EngineController(const kingcap::SearchOptions& opts, QObject* parent)
    : QObject(parent), game(kingcap::Position(), opts) {}

void EngineController::setPosition(const kingcap::Position& pos){
    game.set_position(pos);
}

void EngineController::announce(const QString& lastMove){
    emit positionChanged(game.position(), lastMove);
    kingcap::Outcome o = game.outcome();
    if (o != kingcap::Outcome::Ongoing) emit gameOver(QString::fromUtf8(kingcap::outcome_name(o)));
}

void EngineController::enginePlay(){
    if (game.outcome() != kingcap::Outcome::Ongoing) return;
    auto res = game.play_engine_move();
    if (!res) {
        emit infoMessage("Engine has no legal move");
        return;
    }
    announce(QString::fromStdString(kingcap::move_name(res->move)) + QString(" (score %1)").arg(res->score));
}

bool EngineController::applyHumanMove(const kingcap::Move& m){
    if (game.outcome() != kingcap::Outcome::Ongoing) return false;
    std::string name = kingcap::move_name(m);
    if (!game.play(m)) {
        emit infoMessage("Rejected move: " + QString::fromStdString(name));
        return false;
    }
    announce(QString::fromStdString(name));
    return true;
}

QString EngineController::hint() const {
    auto res = game.suggest();
    if (!res) return "No legal moves";
    return QString("Best move: %1, score to achieve: %2")
        .arg(QString::fromStdString(kingcap::move_name(res->move))).arg(res->score);
}
