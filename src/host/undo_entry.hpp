/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/scene_state.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ssw::host {

    class MemoryScene;

    class UndoEntry {
    public:
        virtual ~UndoEntry() = default;
        virtual void undo() = 0;
        virtual void redo() = 0;
        [[nodiscard]] virtual std::string name() const = 0;
    };

    using UndoEntryPtr = std::unique_ptr<UndoEntry>;

    // Captures the scene on construction and again on captureAfter(); undo and
    // redo swap the whole state back in.
    class SceneSnapshot : public UndoEntry {
    public:
        explicit SceneSnapshot(MemoryScene& scene, std::string name = "Operation");

        void captureAfter();

        void undo() override;
        void redo() override;
        [[nodiscard]] std::string name() const override { return name_; }

    private:
        MemoryScene& scene_;
        std::string name_;

        SceneState before_;
        std::optional<SceneState> after_;
    };

} // namespace ssw::host
