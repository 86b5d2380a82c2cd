#include "BoardWidget.hpp"
#include "kingcap/board_text.hpp"
#include <QPainter>
#include <QMouseEvent>
#include <QDir>
#include <algorithm>

BoardWidget::BoardWidget(QWidget* parent): QWidget(parent) {
    setMinimumSize(480,480); // 60px squares
}

void BoardWidget::setAssetsRoot(const QString& root){
    assetsRoot = root;
    loadAssets();
    update();
}

void BoardWidget::loadAssets(){
    piecePix.clear();
    struct Map { char c; const char* file; } mapping[] = {
        {'P',"white-pawn.png"},{'B',"white-bishop.png"},{'R',"white-rook.png"},{'Q',"white-queen.png"},{'K',"white-king.png"},
        {'p',"black-pawn.png"},{'b',"black-bishop.png"},{'r',"black-rook.png"},{'q',"black-queen.png"},{'k',"black-king.png"}
    };
    for (auto &m : mapping){
        QString path = QDir(assetsRoot).filePath(m.file);
        QPixmap pm(path);
        if (!pm.isNull()) piecePix[m.c] = pm;
    }
}

void BoardWidget::setPosition(const kingcap::Position& pos){
    currentPos = pos;
    selectedSquare = -1;
    update();
}

int BoardWidget::squareAtPoint(int x, int y) const {
    int sqSize = std::min(width(),height())/8;
    if (sqSize <= 0) return -1;
    int offsetX = (width()-sqSize*8)/2;
    int offsetY = (height()-sqSize*8)/2;
    if (x < offsetX || y < offsetY) return -1;
    int file = (x - offsetX) / sqSize;
    int rank = 7 - ((y - offsetY) / sqSize);
    if (file<0||file>7||rank<0||rank>7) return -1;
    return rank*8 + file;
}

void BoardWidget::mousePressEvent(QMouseEvent* ev){
    if (ev->button()!=Qt::LeftButton) return;
    int sq = squareAtPoint(ev->pos().x(), ev->pos().y());
    if (sq<0) return;
    if (selectedSquare == -1) {
        // only pieces of the side to move can be picked up
        auto piece = currentPos.piece_at(kingcap::square_at(sq));
        if (piece && piece->side == currentPos.side_to_move()) {
            selectedSquare = sq; update();
        }
    } else {
        if (sq != selectedSquare) {
            kingcap::Move m{kingcap::square_at(selectedSquare), kingcap::square_at(sq)};
            selectedSquare = -1; update();
            emit moveRequested(m);
        } else {
            selectedSquare = -1; update();
        }
    }
}

void BoardWidget::paintEvent(QPaintEvent*){
    QPainter p(this);
    int sqSize = std::min(width(),height())/8;
    int offsetX = (width()-sqSize*8)/2;
    int offsetY = (height()-sqSize*8)/2;
    QFont font = p.font(); font.setPixelSize(std::max(8, sqSize*2/3)); p.setFont(font);
    for (int rank=7; rank>=0; --rank){
        for (int file=0; file<8; ++file){
            int sq = rank*8 + file;
            QRect r(offsetX + file*sqSize, offsetY + (7-rank)*sqSize, sqSize, sqSize);
            bool light = ((rank+file)%2)==1;
            p.fillRect(r, light? QColor(240,217,181) : QColor(181,136,99));
            if (sq == selectedSquare) {
                p.fillRect(r, QColor(50,120,200,100));
            }
            auto piece = currentPos.piece_at(kingcap::Square{file, rank});
            if (!piece) continue;
            char c = kingcap::piece_char(*piece);
            auto it = piecePix.find(c);
            if (it != piecePix.end()) {
                p.drawPixmap(r, it->second);
            } else {
                // no image set: draw the board-file letter
                p.setPen(piece->side == kingcap::Side::White ? Qt::white : Qt::black);
                p.drawText(r, Qt::AlignCenter, QString(QChar(c)));
            }
        }
    }
}
