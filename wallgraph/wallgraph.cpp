/*-----------------------------------------------------------------------------
 *  wallgraph.cpp
 *---------------------------------------------------------------------------*/
#include "wallgraph.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace cloud2bim {

/* ===== JunctionNode ======================================================= */
JunctionNode::JunctionNode(JunctionId id, cv::Point2d position)
    : id_{id}
    , position_{position}
{}

bool JunctionNode::addLink(const JunctionPtr& neighbour, int wallId)
{
    for (const auto& l : links_) {
        auto sp = l.neighbour.lock();
        if (sp && sp->id() == neighbour->id())
            return false;
    }
    links_.push_back({neighbour, wallId});
    return true;
}

void JunctionNode::removeLinkTo(const JunctionPtr& neighbour)
{
    links_.erase(
        std::remove_if(links_.begin(), links_.end(),
            [&](const WallLink& l) {
                auto sp = l.neighbour.lock();
                return !sp || sp->id() == neighbour->id();
            }),
        links_.end());
}

/* ===== WallGraph ========================================================== */
JunctionPtr WallGraph::addNode(const cv::Point2d& position)
{
    auto node = std::make_shared<JunctionNode>(nextId_++, position);
    nodes_.emplace(node->id(), node);
    return node;
}

bool WallGraph::removeNode(JunctionId id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    JunctionPtr victim = it->second;
    for (auto& kv : nodes_)
        kv.second->removeLinkTo(victim);

    nodes_.erase(it);
    return true;
}

bool WallGraph::connect(JunctionId a, JunctionId b, int wallId)
{
    if (a == b) return false;
    auto na = getNode(a);
    auto nb = getNode(b);
    if (!na || !nb) return false;

    if (!na->addLink(nb, wallId))
        return false;
    nb->addLink(na, wallId);
    return true;
}

bool WallGraph::disconnect(JunctionId a, JunctionId b)
{
    auto na = getNode(a);
    auto nb = getNode(b);
    if (!na || !nb) return false;

    na->removeLinkTo(nb);
    nb->removeLinkTo(na);
    return true;
}

JunctionPtr WallGraph::getNode(JunctionId id) const
{
    auto it = nodes_.find(id);
    return (it == nodes_.end()) ? nullptr : it->second;
}

std::vector<JunctionPtr> WallGraph::allNodes() const
{
    std::vector<JunctionPtr> vec;
    vec.reserve(nodes_.size());
    for (auto& kv : nodes_) vec.push_back(kv.second);
    return vec;
}

size_t WallGraph::linkCount() const noexcept
{
    size_t n = 0;
    for (const auto& kv : nodes_) n += kv.second->degree();
    return n / 2;
}

size_t WallGraph::pruneDangling()
{
    size_t removed = 0;
    bool changed = true;
    while (changed) {
        changed = false;
        std::vector<JunctionId> leaves;
        for (const auto& kv : nodes_)
            if (kv.second->degree() <= 1)
                leaves.push_back(kv.first);
        for (JunctionId id : leaves) {
            removeNode(id);
            ++removed;
            changed = true;
        }
    }
    return removed;
}

std::vector<std::vector<cv::Point2d>> WallGraph::traceFaces() const
{
    /* neighbours of every node sorted counter-clockwise by angle */
    std::map<JunctionId, std::vector<JunctionId>> ccw;
    for (const auto& kv : nodes_) {
        const cv::Point2d& c = kv.second->position();
        std::vector<std::pair<double, JunctionId>> around;
        for (const auto& l : kv.second->links()) {
            auto sp = l.neighbour.lock();
            if (!sp) continue;
            const cv::Point2d d = sp->position() - c;
            around.emplace_back(std::atan2(d.y, d.x), sp->id());
        }
        std::sort(around.begin(), around.end());
        auto& list = ccw[kv.first];
        for (const auto& a : around) list.push_back(a.second);
    }

    std::set<std::pair<JunctionId, JunctionId>> visited;
    std::vector<std::vector<cv::Point2d>> faces;
    for (const auto& kv : ccw) {
        for (JunctionId first : kv.second) {
            std::pair<JunctionId, JunctionId> start{kv.first, first};
            if (visited.count(start)) continue;

            std::vector<cv::Point2d> face;
            JunctionId u = start.first, v = start.second;
            const size_t guard = 2 * linkCount() + 1;
            for (size_t step = 0; step < guard; ++step) {
                visited.insert({u, v});
                face.push_back(nodes_.at(u)->position());

                const auto& list = ccw.at(v);
                const int deg = static_cast<int>(list.size());
                const int idx = static_cast<int>(std::find(list.begin(), list.end(), u) - list.begin());
                const JunctionId w = list[(idx - 1 + deg) % deg];
                u = v;
                v = w;
                if (u == start.first && v == start.second)
                    break;
            }
            faces.push_back(std::move(face));
        }
    }
    return faces;
}

} // namespace cloud2bim
