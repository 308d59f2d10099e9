#include "AtlasPacker.h"

#include <limits>
#include <stdexcept>

namespace terra { namespace globe {
    AtlasPacker::AtlasPacker(int width, int height, int borderSize, int fitTolerance) :
        _width(width), _height(height), _borderSize(borderSize), _fitTolerance(fitTolerance), _nodes()
    {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument("Illegal atlas dimensions");
        }
        if (borderSize < 0 || borderSize > std::numeric_limits<int>::max() / 2 || fitTolerance < 0) {
            throw std::invalid_argument("Illegal atlas border or fit tolerance");
        }
        reset();
    }

    void AtlasPacker::reset() {
        _nodes.clear();
        _nodes.emplace_back(Rectangle(0, 0, _width, _height));
    }

    boost::optional<AtlasPacker::NodeIndex> AtlasPacker::insert(int width, int height) {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument("Illegal image dimensions");
        }
        if (width > _width - 2 * _borderSize || height > _height - 2 * _borderSize) {
            return boost::none;
        }
        const int w = width + 2 * _borderSize;
        const int h = height + 2 * _borderSize;

        // Depth-first, first child before second child
        std::vector<NodeIndex> stack;
        stack.push_back(0);
        while (!stack.empty()) {
            NodeIndex index = stack.back();
            stack.pop_back();

            if (!_nodes[index].isLeaf()) {
                stack.push_back(_nodes[index].children[1]);
                stack.push_back(_nodes[index].children[0]);
                continue;
            }
            if (_nodes[index].occupied) {
                continue;
            }

            const Rectangle rect = _nodes[index].rect;
            if (w > rect.width() || h > rect.height()) {
                continue;
            }

            int dw = rect.width() - w;
            int dh = rect.height() - h;
            if (dw <= _fitTolerance && dh <= _fitTolerance) {
                _nodes[index].occupied = true;
                return index;
            }

            // Split off the part with larger slack, the first child always receives the image
            Rectangle rect0, rect1;
            if (dw > dh) {
                rect0 = Rectangle(rect.left, rect.top, rect.left + w, rect.bottom);
                rect1 = Rectangle(rect.left + w, rect.top, rect.right, rect.bottom);
            }
            else {
                rect0 = Rectangle(rect.left, rect.top, rect.right, rect.top + h);
                rect1 = Rectangle(rect.left, rect.top + h, rect.right, rect.bottom);
            }
            NodeIndex child0 = _nodes.size();
            _nodes.emplace_back(rect0);
            _nodes.emplace_back(rect1);
            _nodes[index].children = { { child0, child0 + 1 } };
            stack.push_back(child0);
        }
        return boost::none;
    }

    const Rectangle& AtlasPacker::getRectangle(NodeIndex index) const {
        return _nodes.at(index).rect;
    }

    bool AtlasPacker::isOccupied(NodeIndex index) const {
        return _nodes.at(index).occupied;
    }
} }
