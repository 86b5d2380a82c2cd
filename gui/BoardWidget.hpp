#pragma once
#include <QWidget>
#include <QPixmap>
#include <unordered_map>
#include "kingcap/position.hpp"

class BoardWidget : public QWidget {
    Q_OBJECT
public:
    explicit BoardWidget(QWidget* parent=nullptr);
    void setPosition(const kingcap::Position& pos);
    const kingcap::Position& position() const { return currentPos; }
    void setAssetsRoot(const QString& root); // path to images
signals:
    void moveRequested(kingcap::Move move); // user picked origin then destination
protected:
    void paintEvent(QPaintEvent* ev) override;
    void mousePressEvent(QMouseEvent* ev) override;
private:
    kingcap::Position currentPos;
    QString assetsRoot;
    std::unordered_map<char,QPixmap> piecePix;
    int selectedSquare = -1;
    int squareAtPoint(int x, int y) const;
    void loadAssets();
};
