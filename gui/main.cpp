#include <QApplication>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QPushButton>
#include <QLabel>
#include <QMessageBox>
#include "BoardWidget.hpp"
#include "EngineController.hpp"
#include "kingcap/board_text.hpp"
#include "kingcap/config.hpp"

int main(int argc, char** argv){
    QApplication app(argc, argv);

    kingcap::GameConfig cfg; std::string err;
    if (!kingcap::parse_game_args(argc, argv, cfg, &err)) {
        QMessageBox::critical(nullptr, "Arguments", QString::fromStdString(err + "\n" + kingcap::game_usage(argv[0])));
        return 2;
    }
    kingcap::Position start;
    if (!kingcap::load_board_file(cfg.boardFile, start, &err)) {
        QMessageBox::critical(nullptr, "Board Error", QString::fromStdString(err));
        return 1;
    }

    QWidget win; win.setWindowTitle("kingcap");
    QVBoxLayout* root = new QVBoxLayout(&win);

    BoardWidget* board = new BoardWidget(&win);
    board->setAssetsRoot(QCoreApplication::applicationDirPath() + "/img");

    EngineController* controller = new EngineController(cfg.search, &win);
    controller->setPosition(start);
    board->setPosition(start);

    QHBoxLayout* buttons = new QHBoxLayout();
    QPushButton* engineMoveBtn = new QPushButton("Engine Move");
    QPushButton* hintBtn = new QPushButton("Hint");
    QPushButton* resetBtn = new QPushButton("Reset Game");
    QLabel* infoLabel = new QLabel("Ready.");
    infoLabel->setWordWrap(true);

    buttons->addWidget(engineMoveBtn);
    buttons->addWidget(hintBtn);
    buttons->addWidget(resetBtn);
    root->addWidget(board);
    root->addLayout(buttons);
    root->addWidget(infoLabel);

    QObject::connect(engineMoveBtn, &QPushButton::clicked, [&]{
        infoLabel->setText("Calculating best move...");
        controller->enginePlay();
    });
    QObject::connect(hintBtn, &QPushButton::clicked, [&]{
        infoLabel->setText(controller->hint());
    });
    QObject::connect(resetBtn, &QPushButton::clicked, [&]{
        controller->setPosition(start); board->setPosition(start); infoLabel->setText("Board reset.");
        engineMoveBtn->setEnabled(true);
    });
    QObject::connect(board, &BoardWidget::moveRequested, [&](kingcap::Move m){
        if (!controller->applyHumanMove(m)) infoLabel->setText("Incorrect move!");
    });
    QObject::connect(controller, &EngineController::positionChanged, [&](const kingcap::Position& newPos, const QString& mv){
        board->setPosition(newPos);
        infoLabel->setText(QString("Played: %1").arg(mv));
    });
    QObject::connect(controller, &EngineController::gameOver, [&](const QString& result){
        engineMoveBtn->setEnabled(false);
        infoLabel->setText(result);
    });
    QObject::connect(controller, &EngineController::infoMessage, [&](const QString& msg){ infoLabel->setText(msg); });

    win.resize(600,700);
    win.show();
    return app.exec();
}
