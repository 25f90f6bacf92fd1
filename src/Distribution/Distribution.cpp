//
// Created by moinshaikh on 1/30/26.
//

#include<vector>

#include"../../include/Distribution/Distribution.hpp"

namespace PsPpo
{
    // [sampleShape..., batch_shape..., event_shape...]
    std::vector<int64_t> Distribution::extendedShape(c10::ArrayRef<int64_t> &sampleShapes)
    {
        std::vector<int64_t> shape(sampleShapes.begin(), sampleShapes.end());
        shape.reserve(shape.size() + batch_shape.size() + event_shape.size());
        for (auto dimension : batch_shape)
        {
            shape.push_back(dimension);
        }
        for (auto dimension : event_shape)
        {
            shape.push_back(dimension);
        }
        return shape;
    }
}
