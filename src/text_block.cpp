#include "text_block.hpp"

#include <algorithm>

namespace comic_mt {

cv::Point2f TextBlock::center() const {
    return cv::Point2f(
        static_cast<float>(xyxy.x1 + xyxy.x2) / 2.0f,
        static_cast<float>(xyxy.y1 + xyxy.y2) / 2.0f
    );
}

BoxXYXY clamp_to_image(const BoxXYXY& box, const cv::Size& image_size) {
    BoxXYXY out;
    out.x1 = std::clamp(box.x1, 0, image_size.width);
    out.y1 = std::clamp(box.y1, 0, image_size.height);
    out.x2 = std::clamp(box.x2, out.x1, image_size.width);
    out.y2 = std::clamp(box.y2, out.y1, image_size.height);
    return out;
}

BoxXYXY expand_box(const BoxXYXY& box, int expand_x_percent, int expand_y_percent, const cv::Size& image_size) {
    const int dx = box.width() * expand_x_percent / 200;
    const int dy = box.height() * expand_y_percent / 200;

    BoxXYXY grown{box.x1 - dx, box.y1 - dy, box.x2 + dx, box.y2 + dy};
    return clamp_to_image(grown, image_size);
}

std::vector<TextBlock> sort_blk_list(std::vector<TextBlock> blocks, bool right_to_left) {
    std::stable_sort(blocks.begin(), blocks.end(), [](const TextBlock& a, const TextBlock& b) {
        return a.center().y < b.center().y;
    });

    std::vector<TextBlock> sorted;
    sorted.reserve(blocks.size());

    for (auto& blk : blocks) {
        const cv::Point2f c = blk.center();
        auto insert_at = sorted.end();

        for (auto it = sorted.begin(); it != sorted.end(); ++it) {
            if (c.y > static_cast<float>(it->xyxy.y2)) {
                continue;
            }
            if (c.y < static_cast<float>(it->xyxy.y1)) {
                insert_at = std::next(it);
                break;
            }

            // Same row: order by horizontal center.
            const float other_x = it->center().x;
            if (right_to_left && c.x > other_x) {
                insert_at = it;
                break;
            }
            if (!right_to_left && c.x < other_x) {
                insert_at = it;
                break;
            }
        }

        sorted.insert(insert_at, std::move(blk));
    }

    return sorted;
}

}  // namespace comic_mt
