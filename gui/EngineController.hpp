#pragma once
#include <QObject>
#include <QString>
#include "kingcap/game.hpp"

class EngineController : public QObject {
    Q_OBJECT
public:
    explicit EngineController(const kingcap::SearchOptions& opts, QObject* parent=nullptr);
    void setPosition(const kingcap::Position& pos); // replace position
    const kingcap::Position& position() const { return game.position(); }
    void enginePlay();                          // engine moves for the side to move
    bool applyHumanMove(const kingcap::Move& m); // validates and applies
    QString hint() const;                       // best move and score, for display
signals:
    void positionChanged(const kingcap::Position& newPos, const QString& lastMove);
    void infoMessage(const QString& msg);
    void gameOver(const QString& result);
private:
    kingcap::Game game;
    void announce(const QString& lastMove);
};
