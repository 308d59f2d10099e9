/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_ATLASPACKER_H_
#define _TERRA_GLOBE_ATLASPACKER_H_

#include "Rectangle.h"

#include <array>
#include <limits>
#include <vector>

#include <boost/optional.hpp>

namespace terra { namespace globe {
    /**
     * Binary space partitioning rectangle packer. Nodes are kept in an arena and refer to their children by index.
     * Leaves are either free, occupied by a single image or split into two children.
     */
    class AtlasPacker final {
    public:
        using NodeIndex = std::size_t;

        explicit AtlasPacker(int width, int height, int borderSize = 0, int fitTolerance = 0);

        int getWidth() const { return _width; }
        int getHeight() const { return _height; }
        int getBorderSize() const { return _borderSize; }
        int getFitTolerance() const { return _fitTolerance; }

        // Clears the tree to a single free root node
        void reset();

        // Finds a leaf for an image of the given size (border excluded). Returns none if the image does not fit anywhere.
        boost::optional<NodeIndex> insert(int width, int height);

        std::size_t getNodeCount() const { return _nodes.size(); }

        // Rectangle of the node, including the border around the image
        const Rectangle& getRectangle(NodeIndex index) const;

        bool isOccupied(NodeIndex index) const;

    private:
        inline static constexpr NodeIndex NO_CHILD = std::numeric_limits<NodeIndex>::max();

        struct Node {
            Rectangle rect;
            std::array<NodeIndex, 2> children = { { NO_CHILD, NO_CHILD } };
            bool occupied = false;

            explicit Node(const Rectangle& rect) : rect(rect) { }

            bool isLeaf() const { return children[0] == NO_CHILD; }
        };

        int _width;
        int _height;
        int _borderSize;
        int _fitTolerance;
        std::vector<Node> _nodes;
    };
} }

#endif
